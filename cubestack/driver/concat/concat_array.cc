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

#include "cubestack/driver/concat/concat_array.h"

#include <algorithm>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/missing_array.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/internal/log/verbose_flag.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag concat_logging("concat");

/// Advances `indices` to the next position in C order within `shape`.
/// Returns `false` after the last position.
bool AdvanceIndices(span<const Index> shape, span<Index> indices) {
  for (DimensionIndex dim = static_cast<DimensionIndex>(shape.size()) - 1;
       dim >= 0; --dim) {
    if (++indices[dim] < shape[dim]) return true;
    indices[dim] = 0;
  }
  return false;
}

Index LinearCellIndex(span<const Index> grid_shape,
                      span<const Index> grid_indices) {
  Index linear = 0;
  for (size_t i = 0; i < grid_shape.size(); ++i) {
    linear = linear * grid_shape[i] + grid_indices[i];
  }
  return linear;
}

/// Portion of a read along one dimension that falls within one block.
struct Segment {
  Index block;
  Index local_origin;
  Index size;
  Index output_origin;
};

}  // namespace

Result<std::shared_ptr<const ConcatArrayHandle>> ConcatArrayHandle::Make(
    span<const Index> grid_shape, std::vector<ArrayHandlePtr> cells,
    std::optional<std::vector<std::vector<Index>>> block_extents,
    DataType dtype) {
  const DimensionIndex rank = grid_shape.size();
  for (Index n : grid_shape) {
    if (n <= 0) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Invalid grid shape {", absl::StrJoin(grid_shape, ", "), "}"));
    }
  }
  if (static_cast<Index>(cells.size()) != ProductOfExtents(grid_shape)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Grid of shape {", absl::StrJoin(grid_shape, ", "), "} requires ",
        ProductOfExtents(grid_shape), " cells but received ", cells.size()));
  }

  // Per-dimension, per-block extent, and the cell whose chunking describes
  // the block.
  std::vector<std::vector<std::optional<Index>>> extents(rank);
  std::vector<std::vector<const ArrayHandle*>> chunk_sources(rank);
  for (DimensionIndex dim = 0; dim < rank; ++dim) {
    extents[dim].resize(grid_shape[dim]);
    chunk_sources[dim].resize(grid_shape[dim], nullptr);
  }
  if (block_extents) {
    if (static_cast<DimensionIndex>(block_extents->size()) != rank) {
      return absl::InvalidArgumentError(
          absl::StrCat("Block extents have rank ", block_extents->size(),
                       " but grid has rank ", rank));
    }
    for (DimensionIndex dim = 0; dim < rank; ++dim) {
      const auto& e = (*block_extents)[dim];
      if (static_cast<Index>(e.size()) != grid_shape[dim]) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Expected ", grid_shape[dim], " block extents for dimension ",
            dim, " but received ", e.size()));
      }
      for (Index b = 0; b < grid_shape[dim]; ++b) {
        if (e[b] < 0) {
          return absl::InvalidArgumentError(absl::StrCat(
              "Invalid block extent ", e[b], " for dimension ", dim));
        }
        extents[dim][b] = e[b];
      }
    }
  }

  std::vector<Index> grid_indices(rank, 0);
  Index num_missing = 0;
  for (size_t i = 0; i < cells.size();
       ++i, AdvanceIndices(grid_shape, grid_indices)) {
    const auto& cell = cells[i];
    if (!cell) {
      ++num_missing;
      ABSL_LOG_IF(INFO, concat_logging)
          << "Missing grid cell {" << absl::StrJoin(grid_indices, ", ")
          << "}";
      continue;
    }
    if (!dtype.valid()) dtype = cell->dtype();
    if (cell->dtype() != dtype) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Cell {", absl::StrJoin(grid_indices, ", "), "} has data type ",
          cell->dtype().name(), " but expected ", dtype.name()));
    }
    const auto shape = cell->shape();
    if (static_cast<DimensionIndex>(shape.size()) != rank) {
      return absl::InvalidArgumentError(
          absl::StrCat("Cell {", absl::StrJoin(grid_indices, ", "),
                       "} has rank ", shape.size(), " but grid has rank ",
                       rank));
    }
    for (DimensionIndex dim = 0; dim < rank; ++dim) {
      auto& extent = extents[dim][grid_indices[dim]];
      if (!extent) {
        extent = shape[dim];
      } else if (*extent != shape[dim]) {
        return MakeError(
            ErrorKind::kShapeMismatch,
            absl::StrCat("Cell {", absl::StrJoin(grid_indices, ", "),
                         "} has extent ", shape[dim], " along dimension ",
                         dim, " but other cells of the same slab have extent ",
                         *extent));
      }
      auto& chunk_source = chunk_sources[dim][grid_indices[dim]];
      if (!chunk_source) chunk_source = cell.get();
    }
  }
  if (!dtype.valid()) {
    return absl::InvalidArgumentError(
        "Data type must be specified when all cells are absent");
  }

  std::vector<std::vector<Index>> boundaries(rank);
  for (DimensionIndex dim = 0; dim < rank; ++dim) {
    Index position = 0;
    boundaries[dim].push_back(position);
    for (Index b = 0; b < grid_shape[dim]; ++b) {
      if (!extents[dim][b]) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Extent of block ", b, " along dimension ", dim,
            " cannot be determined because all of its cells are absent"));
      }
      position += *extents[dim][b];
      boundaries[dim].push_back(position);
    }
  }

  // Absent cells read through a missing-value handle of the block's shape.
  std::fill(grid_indices.begin(), grid_indices.end(), 0);
  for (size_t i = 0; i < cells.size();
       ++i, AdvanceIndices(grid_shape, grid_indices)) {
    if (cells[i]) continue;
    std::vector<Index> shape(rank);
    for (DimensionIndex dim = 0; dim < rank; ++dim) {
      shape[dim] = *extents[dim][grid_indices[dim]];
    }
    CUBESTACK_ASSIGN_OR_RETURN(cells[i],
                               MakeMissingArrayHandle(dtype, std::move(shape)));
  }

  // Along each dimension the composite chunking is the concatenation of the
  // chunking of one cell per block, preferring cells that were present.
  std::vector<std::vector<Index>> chunk_extents(rank);
  for (DimensionIndex dim = 0; dim < rank; ++dim) {
    std::vector<ChunkGrid> block_grids;
    block_grids.reserve(grid_shape[dim]);
    for (Index b = 0; b < grid_shape[dim]; ++b) {
      const ArrayHandle* source = chunk_sources[dim][b];
      if (!source) {
        std::vector<Index> indices(rank, 0);
        indices[dim] = b;
        source = cells[LinearCellIndex(grid_shape, indices)].get();
      }
      block_grids.push_back(source->chunk_grid());
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto grid,
                               ChunkGrid::Concatenate(block_grids, dim));
    const auto e = grid.extents(dim);
    chunk_extents[dim].assign(e.begin(), e.end());
  }

  ABSL_LOG_IF(INFO, concat_logging && num_missing > 0)
      << "Concatenated grid {" << absl::StrJoin(grid_shape, ", ") << "} with "
      << num_missing << " missing cells";

  std::shared_ptr<ConcatArrayHandle> handle(new ConcatArrayHandle);
  handle->dtype_ = dtype;
  handle->grid_shape_.assign(grid_shape.begin(), grid_shape.end());
  handle->cells_ = std::move(cells);
  handle->boundaries_ = std::move(boundaries);
  handle->chunk_grid_ = ChunkGrid(std::move(chunk_extents));
  return handle;
}

std::vector<Index> ConcatArrayHandle::shape() const {
  std::vector<Index> shape;
  shape.reserve(boundaries_.size());
  for (const auto& b : boundaries_) shape.push_back(b.back());
  return shape;
}

const ArrayHandlePtr& ConcatArrayHandle::cell(
    span<const Index> grid_indices) const {
  return cells_[LinearCellIndex(grid_shape_, grid_indices)];
}

Result<SharedArray> ConcatArrayHandle::Read(const Box& box) const {
  CUBESTACK_RETURN_IF_ERROR(ValidateReadBox(*this, box));
  SharedArray output = AllocateArray(dtype_, box.shape());
  if (box.is_empty()) return output;

  const DimensionIndex rank = box.rank();
  std::vector<std::vector<Segment>> segments(rank);
  for (DimensionIndex dim = 0; dim < rank; ++dim) {
    const auto& bounds = boundaries_[dim];
    const Index lo = box.origin(dim);
    const Index hi = box.exclusive_max(dim);
    Index block =
        std::upper_bound(bounds.begin(), bounds.end(), lo) - bounds.begin() - 1;
    for (; block < grid_shape_[dim] && bounds[block] < hi; ++block) {
      const Index start = std::max(lo, bounds[block]);
      const Index stop = std::min(hi, bounds[block + 1]);
      if (start >= stop) continue;
      segments[dim].push_back(
          Segment{block, start - bounds[block], stop - start, start - lo});
    }
  }

  std::vector<Index> num_segments(rank);
  for (DimensionIndex dim = 0; dim < rank; ++dim) {
    num_segments[dim] = segments[dim].size();
  }
  std::vector<Index> position(rank, 0);
  std::vector<Index> grid_indices(rank);
  std::vector<Index> local_origin(rank);
  std::vector<Index> local_shape(rank);
  std::vector<Index> output_origin(rank);
  do {
    for (DimensionIndex dim = 0; dim < rank; ++dim) {
      const Segment& s = segments[dim][position[dim]];
      grid_indices[dim] = s.block;
      local_origin[dim] = s.local_origin;
      local_shape[dim] = s.size;
      output_origin[dim] = s.output_origin;
    }
    const Box local_box(local_origin, local_shape);
    CUBESTACK_ASSIGN_OR_RETURN(
        auto block, cell(grid_indices)->Read(local_box),
        MaybeAnnotateStatus(
            _, absl::StrCat("Reading grid cell {",
                            absl::StrJoin(grid_indices, ", "), "}")));
    CUBESTACK_RETURN_IF_ERROR(CopyArrayRegion(
        block, Box(local_shape), output, output_origin));
  } while (AdvanceIndices(num_segments, position));
  return output;
}

}  // namespace cubestack
