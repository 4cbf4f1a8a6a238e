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

#include "cubestack/cube.h"

#include <algorithm>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include <nlohmann/json.hpp>
#include "cubestack/array.h"
#include "cubestack/axis.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/subset_array.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {

Result<Cube> Cube::Make(std::vector<Axis> axes, ArrayHandlePtr handle,
                        Attributes attributes) {
  if (!handle) {
    return absl::InvalidArgumentError("Cube requires a data handle");
  }
  if (!attributes.is_object()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Attributes must be an object, but received: ", attributes.dump()));
  }
  const auto shape = handle->shape();
  if (shape.size() != axes.size()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Data of rank ", shape.size(), " does not match ",
                     axes.size(), " axes"));
  }
  absl::flat_hash_set<std::string> names;
  for (size_t i = 0; i < axes.size(); ++i) {
    if (!names.insert(axes[i].name()).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate axis name \"", axes[i].name(), "\""));
    }
    if (axes[i].size() != shape[i]) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Axis ", axes[i].name(), " has length ", axes[i].size(),
          " but data has extent ", shape[i], " along dimension ", i));
    }
  }
  Cube cube;
  cube.axes_ = std::move(axes);
  cube.handle_ = std::move(handle);
  cube.attributes_ = std::move(attributes);
  return cube;
}

std::vector<Index> Cube::shape() const {
  std::vector<Index> shape;
  shape.reserve(axes_.size());
  for (const auto& axis : axes_) shape.push_back(axis.size());
  return shape;
}

std::optional<DimensionIndex> Cube::FindAxis(std::string_view name) const {
  for (size_t i = 0; i < axes_.size(); ++i) {
    if (axes_[i].name() == name) return i;
  }
  return std::nullopt;
}

std::vector<std::string> Cube::axis_names() const {
  std::vector<std::string> names;
  names.reserve(axes_.size());
  for (const auto& axis : axes_) names.push_back(axis.name());
  return names;
}

Result<Cube> Cube::Subset(span<const AxisRange> ranges) const {
  Box box(shape());
  std::vector<Axis> axes = axes_;
  bool changed = false;
  for (const auto& range : ranges) {
    auto dim = FindAxis(range.axis);
    if (!dim) continue;
    CUBESTACK_ASSIGN_OR_RETURN(axes[*dim],
                               axes_[*dim].Slice(range.start,
                                                 range.stop - range.start));
    box.set_interval(*dim, range.start, range.stop - range.start);
    changed = true;
  }
  if (!changed) return *this;
  CUBESTACK_ASSIGN_OR_RETURN(auto handle, MakeSubsetArrayHandle(handle_, box));
  return Make(std::move(axes), std::move(handle), attributes_);
}

Result<Cube> Cube::WithChunkSizes(const ChunkSizes& chunk_sizes) const {
  const ChunkGrid grid = handle_->chunk_grid();
  std::vector<std::vector<Index>> extents(rank());
  bool changed = false;
  for (DimensionIndex dim = 0; dim < rank(); ++dim) {
    auto it = chunk_sizes.find(axes_[dim].name());
    if (it == chunk_sizes.end()) {
      const auto e = grid.extents(dim);
      extents[dim].assign(e.begin(), e.end());
      continue;
    }
    const Index size = it->second;
    if (size <= 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Invalid chunk size ", size, " for axis ", axes_[dim].name()));
    }
    const Index extent = axes_[dim].size();
    for (Index start = 0; start < extent; start += size) {
      extents[dim].push_back(std::min(size, extent - start));
    }
    changed = true;
  }
  if (!changed) return *this;
  CUBESTACK_ASSIGN_OR_RETURN(
      auto handle, MakeChunkView(handle_, ChunkGrid(std::move(extents))));
  Cube cube = *this;
  cube.handle_ = std::move(handle);
  return cube;
}

Result<SharedArray> Cube::Read() const { return ReadAll(*handle_); }

Index Cube::num_bytes() const {
  return ProductOfExtents(shape()) * dtype().size();
}

std::ostream& operator<<(std::ostream& os, const Cube& cube) {
  os << "Cube " << cube.dtype() << " {"
     << absl::StrJoin(cube.axes_, ", ",
                      [](std::string* out, const Axis& axis) {
                        absl::StrAppend(out, axis.name(), "=", axis.size());
                      })
     << "}";
  if (!cube.attributes_.empty()) os << " " << cube.attributes_.dump();
  return os;
}

Attributes MergeAttributes(Attributes attributes, const Attributes& other) {
  for (auto it = other.begin(); it != other.end(); ++it) {
    attributes[it.key()] = it.value();
  }
  return attributes;
}

}  // namespace cubestack
