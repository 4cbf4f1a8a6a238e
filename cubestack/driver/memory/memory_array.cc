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

#include "cubestack/driver/memory/memory_array.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/synchronization/mutex.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

absl::Status ValidateChunkGrid(const ChunkGrid& chunk_grid,
                               span<const Index> shape) {
  const auto grid_shape = chunk_grid.shape();
  if (grid_shape.size() != shape.size() ||
      !std::equal(grid_shape.begin(), grid_shape.end(), shape.begin())) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Chunk grid ", absl::StrJoin(grid_shape, ", "),
        " does not match array shape {", absl::StrJoin(shape, ", "), "}"));
  }
  return absl::OkStatus();
}

}  // namespace

MemoryArrayHandle::MemoryArrayHandle(SharedArray data, ChunkGrid chunk_grid)
    : dtype_(data.dtype()),
      shape_(data.shape().begin(), data.shape().end()),
      chunk_grid_(std::move(chunk_grid)),
      data_(std::move(data)) {}

Result<std::shared_ptr<MemoryArrayHandle>> MemoryArrayHandle::Make(
    const SharedArray& array, std::optional<ChunkGrid> chunk_grid) {
  if (!array.valid() || !array.dtype().valid()) {
    return absl::InvalidArgumentError("Cannot make handle from null array");
  }
  if (chunk_grid) {
    CUBESTACK_RETURN_IF_ERROR(ValidateChunkGrid(*chunk_grid, array.shape()));
  } else {
    chunk_grid = ChunkGrid::SingleChunk(array.shape());
  }
  const Box full(
      std::vector<Index>(array.shape().begin(), array.shape().end()));
  CUBESTACK_ASSIGN_OR_RETURN(auto copy, SubArray(array, full));
  return std::shared_ptr<MemoryArrayHandle>(
      new MemoryArrayHandle(std::move(copy), *std::move(chunk_grid)));
}

Result<std::shared_ptr<MemoryArrayHandle>> MemoryArrayHandle::Allocate(
    DataType dtype, span<const Index> shape,
    std::optional<ChunkGrid> chunk_grid) {
  if (!dtype.valid()) {
    return absl::InvalidArgumentError("Data type must be specified");
  }
  for (Index extent : shape) {
    if (extent < 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid shape {", absl::StrJoin(shape, ", "), "}"));
    }
  }
  if (chunk_grid) {
    CUBESTACK_RETURN_IF_ERROR(ValidateChunkGrid(*chunk_grid, shape));
  } else {
    chunk_grid = ChunkGrid::SingleChunk(shape);
  }
  return std::shared_ptr<MemoryArrayHandle>(new MemoryArrayHandle(
      AllocateMissingArray(dtype, shape), *std::move(chunk_grid)));
}

Result<SharedArray> MemoryArrayHandle::Read(const Box& box) const {
  CUBESTACK_RETURN_IF_ERROR(ValidateReadBox(*this, box));
  absl::MutexLock lock(&mutex_);
  CUBESTACK_ASSIGN_OR_RETURN(auto result, SubArray(data_, box));
  ++read_count_;
  return result;
}

absl::Status MemoryArrayHandle::Write(span<const Index> origin,
                                      const SharedArray& data) {
  if (data.dtype() != dtype_) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Cannot write ", data.dtype().name(), " data to ", dtype_.name(),
        " array"));
  }
  const Box source_box(
      std::vector<Index>(data.shape().begin(), data.shape().end()));
  absl::MutexLock lock(&mutex_);
  CUBESTACK_RETURN_IF_ERROR(
      CopyArrayRegion(data, source_box, data_, origin));
  ++write_count_;
  return absl::OkStatus();
}

Index MemoryArrayHandle::read_count() const {
  absl::MutexLock lock(&mutex_);
  return read_count_;
}

Index MemoryArrayHandle::write_count() const {
  absl::MutexLock lock(&mutex_);
  return write_count_;
}

}  // namespace cubestack
