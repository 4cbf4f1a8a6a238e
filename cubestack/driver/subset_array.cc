// Copyright 2026 The Cubestack Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "cubestack/driver/subset_array.h"

#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

/// Returns `box` shifted by the origin of `subset`.
Box TranslateBox(const Box& box, const Box& subset) {
  Box result = box;
  for (DimensionIndex i = 0; i < box.rank(); ++i) {
    result.set_interval(i, box.origin(i) + subset.origin(i), box.shape(i));
  }
  return result;
}

class SubsetArrayHandle : public ArrayHandle {
 public:
  SubsetArrayHandle(ArrayHandlePtr base, Box box, ChunkGrid chunk_grid)
      : base_(std::move(base)),
        box_(std::move(box)),
        chunk_grid_(std::move(chunk_grid)) {}

  DataType dtype() const override { return base_->dtype(); }

  std::vector<Index> shape() const override {
    return std::vector<Index>(box_.shape().begin(), box_.shape().end());
  }

  ChunkGrid chunk_grid() const override { return chunk_grid_; }

  Result<SharedArray> Read(const Box& box) const override {
    CUBESTACK_RETURN_IF_ERROR(ValidateReadBox(*this, box));
    return base_->Read(TranslateBox(box, box_));
  }

 private:
  ArrayHandlePtr base_;
  Box box_;
  ChunkGrid chunk_grid_;
};

/// Writable counterpart of `SubsetArrayHandle`.
class WritableSubsetArrayHandle : public WritableArrayHandle {
 public:
  WritableSubsetArrayHandle(WritableArrayHandlePtr base, Box box,
                            ChunkGrid chunk_grid)
      : base_(std::move(base)),
        box_(std::move(box)),
        chunk_grid_(std::move(chunk_grid)) {}

  DataType dtype() const override { return base_->dtype(); }

  std::vector<Index> shape() const override {
    return std::vector<Index>(box_.shape().begin(), box_.shape().end());
  }

  ChunkGrid chunk_grid() const override { return chunk_grid_; }

  Result<SharedArray> Read(const Box& box) const override {
    CUBESTACK_RETURN_IF_ERROR(ValidateReadBox(*this, box));
    return base_->Read(TranslateBox(box, box_));
  }

  absl::Status Write(span<const Index> origin,
                     const SharedArray& data) override {
    const Box box(std::vector<Index>(origin.begin(), origin.end()),
                  std::vector<Index>(data.shape().begin(), data.shape().end()));
    CUBESTACK_RETURN_IF_ERROR(
        ValidateBoxWithinShape(box, box_.shape()),
        MaybeAnnotateStatus(_, "Cannot write to subset of array"));
    const Box base_box = TranslateBox(box, box_);
    return base_->Write(base_box.origin(), data);
  }

 private:
  WritableArrayHandlePtr base_;
  Box box_;
  ChunkGrid chunk_grid_;
};

class ChunkView : public ArrayHandle {
 public:
  ChunkView(ArrayHandlePtr base, ChunkGrid chunk_grid)
      : base_(std::move(base)), chunk_grid_(std::move(chunk_grid)) {}

  DataType dtype() const override { return base_->dtype(); }
  std::vector<Index> shape() const override { return base_->shape(); }
  ChunkGrid chunk_grid() const override { return chunk_grid_; }

  Result<SharedArray> Read(const Box& box) const override {
    return base_->Read(box);
  }

 private:
  ArrayHandlePtr base_;
  ChunkGrid chunk_grid_;
};

/// Presents `base` with an additional dimension of extent 1 at `dim`.
class NewAxisArrayHandle : public ArrayHandle {
 public:
  NewAxisArrayHandle(ArrayHandlePtr base, DimensionIndex dim)
      : base_(std::move(base)), dim_(dim) {}

  DataType dtype() const override { return base_->dtype(); }

  std::vector<Index> shape() const override {
    auto shape = base_->shape();
    shape.insert(shape.begin() + dim_, 1);
    return shape;
  }

  ChunkGrid chunk_grid() const override {
    const ChunkGrid base_grid = base_->chunk_grid();
    std::vector<std::vector<Index>> extents;
    for (DimensionIndex i = 0; i < base_grid.rank(); ++i) {
      if (i == dim_) extents.push_back({1});
      const auto e = base_grid.extents(i);
      extents.emplace_back(e.begin(), e.end());
    }
    if (dim_ == base_grid.rank()) extents.push_back({1});
    return ChunkGrid(std::move(extents));
  }

  Result<SharedArray> Read(const Box& box) const override {
    CUBESTACK_RETURN_IF_ERROR(ValidateReadBox(*this, box));
    std::vector<Index> origin(box.origin().begin(), box.origin().end());
    std::vector<Index> shape(box.shape().begin(), box.shape().end());
    const Index n = shape[dim_];
    origin.erase(origin.begin() + dim_);
    shape.erase(shape.begin() + dim_);
    if (n == 0) {
      return AllocateArray(dtype(), box.shape());
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto data,
                               base_->Read(Box(std::move(origin), shape)));
    shape.insert(shape.begin() + dim_, 1);
    return SharedArray(data.dtype(), std::move(shape), data.shared_data());
  }

 private:
  ArrayHandlePtr base_;
  DimensionIndex dim_;
};

/// Presents position `index` of dimension `dim` of `base`.
class SliceArrayHandle : public ArrayHandle {
 public:
  SliceArrayHandle(ArrayHandlePtr base, DimensionIndex dim, Index index)
      : base_(std::move(base)), dim_(dim), index_(index) {}

  DataType dtype() const override { return base_->dtype(); }

  std::vector<Index> shape() const override {
    auto shape = base_->shape();
    shape.erase(shape.begin() + dim_);
    return shape;
  }

  ChunkGrid chunk_grid() const override {
    const ChunkGrid base_grid = base_->chunk_grid();
    std::vector<std::vector<Index>> extents;
    for (DimensionIndex i = 0; i < base_grid.rank(); ++i) {
      if (i == dim_) continue;
      const auto e = base_grid.extents(i);
      extents.emplace_back(e.begin(), e.end());
    }
    return ChunkGrid(std::move(extents));
  }

  Result<SharedArray> Read(const Box& box) const override {
    CUBESTACK_RETURN_IF_ERROR(ValidateReadBox(*this, box));
    std::vector<Index> origin(box.origin().begin(), box.origin().end());
    std::vector<Index> shape(box.shape().begin(), box.shape().end());
    origin.insert(origin.begin() + dim_, index_);
    shape.insert(shape.begin() + dim_, 1);
    CUBESTACK_ASSIGN_OR_RETURN(
        auto data, base_->Read(Box(std::move(origin), std::move(shape))));
    return SharedArray(data.dtype(),
                       std::vector<Index>(box.shape().begin(),
                                          box.shape().end()),
                       data.shared_data());
  }

 private:
  ArrayHandlePtr base_;
  DimensionIndex dim_;
  Index index_;
};

}  // namespace

Result<ArrayHandlePtr> MakeSubsetArrayHandle(ArrayHandlePtr base,
                                             const Box& box) {
  CUBESTACK_ASSIGN_OR_RETURN(
      auto chunk_grid, base->chunk_grid().Subset(box),
      MaybeAnnotateStatus(_, "Cannot take subset of array"));
  return std::make_shared<SubsetArrayHandle>(std::move(base), box,
                                             std::move(chunk_grid));
}

Result<WritableArrayHandlePtr> MakeWritableSubsetArrayHandle(
    WritableArrayHandlePtr base, const Box& box) {
  CUBESTACK_ASSIGN_OR_RETURN(
      auto chunk_grid, base->chunk_grid().Subset(box),
      MaybeAnnotateStatus(_, "Cannot take subset of array"));
  return std::make_shared<WritableSubsetArrayHandle>(std::move(base), box,
                                                     std::move(chunk_grid));
}

Result<ArrayHandlePtr> MakeChunkView(ArrayHandlePtr base,
                                     ChunkGrid chunk_grid) {
  const auto shape = base->shape();
  if (chunk_grid.shape() != shape) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Chunk grid of shape {", absl::StrJoin(chunk_grid.shape(), ", "),
        "} does not match array shape {", absl::StrJoin(shape, ", "), "}"));
  }
  return std::make_shared<ChunkView>(std::move(base), std::move(chunk_grid));
}

Result<ArrayHandlePtr> MakeNewAxisArrayHandle(ArrayHandlePtr base,
                                              DimensionIndex dim) {
  if (dim < 0 || dim > base->rank()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Cannot insert dimension ", dim, " into array of rank ",
        base->rank()));
  }
  return std::make_shared<NewAxisArrayHandle>(std::move(base), dim);
}

Result<ArrayHandlePtr> MakeSliceArrayHandle(ArrayHandlePtr base,
                                            DimensionIndex dim, Index index) {
  const auto shape = base->shape();
  if (dim < 0 || dim >= static_cast<DimensionIndex>(shape.size())) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Dimension ", dim, " is outside array of rank ", shape.size()));
  }
  if (index < 0 || index >= shape[dim]) {
    return absl::OutOfRangeError(
        absl::StrCat("Index ", index, " is outside [0, ", shape[dim],
                     ") of dimension ", dim));
  }
  return std::make_shared<SliceArrayHandle>(std::move(base), dim, index);
}

}  // namespace cubestack
