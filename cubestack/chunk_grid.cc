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

#include "cubestack/chunk_grid.h"

#include <algorithm>
#include <ostream>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/box.h"
#include "cubestack/index.h"
#include "cubestack/util/status.h"

namespace cubestack {

Result<ChunkGrid> ChunkGrid::Regular(span<const Index> shape,
                                     span<const Index> chunk_shape,
                                     span<const Index> offset) {
  if (chunk_shape.size() != shape.size() ||
      (!offset.empty() && offset.size() != shape.size())) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Chunk shape {", absl::StrJoin(chunk_shape, ", "),
        "} and offset {", absl::StrJoin(offset, ", "),
        "} do not match rank ", shape.size()));
  }
  std::vector<std::vector<Index>> extents(shape.size());
  for (size_t dim = 0; dim < shape.size(); ++dim) {
    const Index chunk = chunk_shape[dim];
    const Index o = offset.empty() ? 0 : offset[dim];
    if (chunk <= 0 || o < 0 || o >= chunk) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid chunk size ", chunk, " with offset ", o,
                       " for dimension ", dim));
    }
    Index position = 0;
    Index next = chunk - o;
    while (position < shape[dim]) {
      const Index end = std::min(next, shape[dim]);
      extents[dim].push_back(end - position);
      position = end;
      next += chunk;
    }
  }
  return ChunkGrid(std::move(extents));
}

ChunkGrid ChunkGrid::SingleChunk(span<const Index> shape) {
  std::vector<std::vector<Index>> extents;
  extents.reserve(shape.size());
  for (Index extent : shape) {
    extents.push_back(extent == 0 ? std::vector<Index>{}
                                  : std::vector<Index>{extent});
  }
  return ChunkGrid(std::move(extents));
}

std::vector<Index> ChunkGrid::shape() const {
  std::vector<Index> shape;
  shape.reserve(rank());
  for (const auto& e : extents_) {
    Index total = 0;
    for (Index x : e) total += x;
    shape.push_back(total);
  }
  return shape;
}

std::vector<Index> ChunkGrid::boundaries(DimensionIndex dim) const {
  std::vector<Index> result;
  result.reserve(extents_[dim].size() + 1);
  Index position = 0;
  result.push_back(position);
  for (Index e : extents_[dim]) {
    position += e;
    result.push_back(position);
  }
  return result;
}

Index ChunkGrid::approx_chunk_size(DimensionIndex dim) const {
  const auto& e = extents_[dim];
  if (e.empty()) return 1;
  return *std::max_element(e.begin(), e.end());
}

Index ChunkGrid::grid_offset(DimensionIndex dim) const {
  const auto& e = extents_[dim];
  if (e.size() < 2) return 0;
  return approx_chunk_size(dim) - e.front();
}

std::vector<Index> ChunkGrid::approx_chunk_shape() const {
  std::vector<Index> result(rank());
  for (DimensionIndex i = 0; i < rank(); ++i) result[i] = approx_chunk_size(i);
  return result;
}

std::vector<Index> ChunkGrid::grid_offsets() const {
  std::vector<Index> result(rank());
  for (DimensionIndex i = 0; i < rank(); ++i) result[i] = grid_offset(i);
  return result;
}

Result<ChunkGrid> ChunkGrid::Subset(const Box& box) const {
  CUBESTACK_RETURN_IF_ERROR(ValidateBoxWithinShape(box, shape()));
  std::vector<std::vector<Index>> extents(rank());
  for (DimensionIndex dim = 0; dim < rank(); ++dim) {
    const Index lo = box.origin(dim);
    const Index hi = box.exclusive_max(dim);
    Index position = 0;
    for (Index e : extents_[dim]) {
      const Index start = std::max(position, lo);
      const Index stop = std::min(position + e, hi);
      if (start < stop) extents[dim].push_back(stop - start);
      position += e;
    }
  }
  return ChunkGrid(std::move(extents));
}

Result<ChunkGrid> ChunkGrid::Concatenate(span<const ChunkGrid> grids,
                                         DimensionIndex dim) {
  if (grids.empty()) {
    return absl::InvalidArgumentError("Cannot concatenate zero chunk grids");
  }
  const DimensionIndex rank = grids[0].rank();
  if (dim < 0 || dim >= rank) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Concatenation dimension ", dim, " is outside rank ", rank));
  }
  std::vector<std::vector<Index>> extents = grids[0].extents_;
  for (size_t i = 1; i < grids.size(); ++i) {
    if (grids[i].rank() != rank) {
      return absl::InvalidArgumentError(
          absl::StrCat("Chunk grid ", i, " has rank ", grids[i].rank(),
                       " but expected ", rank));
    }
    const auto& e = grids[i].extents_[dim];
    extents[dim].insert(extents[dim].end(), e.begin(), e.end());
  }
  return ChunkGrid(std::move(extents));
}

std::ostream& operator<<(std::ostream& os, const ChunkGrid& grid) {
  os << "{";
  for (DimensionIndex i = 0; i < grid.rank(); ++i) {
    if (i != 0) os << ", ";
    os << "[" << absl::StrJoin(grid.extents_[i], ", ") << "]";
  }
  return os << "}";
}

}  // namespace cubestack
