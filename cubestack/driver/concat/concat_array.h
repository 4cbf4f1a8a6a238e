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

#ifndef CUBESTACK_DRIVER_CONCAT_CONCAT_ARRAY_H_
#define CUBESTACK_DRIVER_CONCAT_CONCAT_ARRAY_H_

#include <memory>
#include <optional>
#include <vector>

#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Read-only array formed by stitching an n-dimensional grid of array handles
/// together without copying.
///
/// The grid has one block per cell; the block extents along each dimension
/// are shared by all cells of the same grid slab, so the composite shape is
/// the sum of block extents along every dimension.  A cell may be absent, in
/// which case reads of its region yield the missing value of the data type.
///
/// A read is decomposed into one sub-read per intersecting cell, expressed in
/// the cell's own coordinates.  No synchronization is added: concurrent reads
/// of the composite are safe whenever concurrent reads of the cells are.
class ConcatArrayHandle : public ArrayHandle {
 public:
  /// Constructs a composite handle.  Only shapes, data types and chunk grids
  /// of `cells` are consulted; no element data is read.
  ///
  /// \param grid_shape Number of blocks along each dimension.
  /// \param cells C-order cells of the grid; `nullptr` marks an absent cell.
  /// \param block_extents Optional per-dimension block extents.  Required
  ///     only for slabs that contain no present cell.
  /// \param dtype Data type, required only if no cell is present.
  /// \error `absl::StatusCode::kInvalidArgument` if the number of cells does
  ///     not match `grid_shape`, or if ranks, data types or extents of the
  ///     cells are inconsistent.
  static Result<std::shared_ptr<const ConcatArrayHandle>> Make(
      span<const Index> grid_shape, std::vector<ArrayHandlePtr> cells,
      std::optional<std::vector<std::vector<Index>>> block_extents = {},
      DataType dtype = {});

  DataType dtype() const override { return dtype_; }
  std::vector<Index> shape() const override;
  ChunkGrid chunk_grid() const override { return chunk_grid_; }
  Result<SharedArray> Read(const Box& box) const override;

  span<const Index> grid_shape() const { return grid_shape_; }

  /// Returns the cell at the given grid position.  Cells that were absent
  /// are replaced by a handle that reads as missing values.
  const ArrayHandlePtr& cell(span<const Index> grid_indices) const;

 private:
  ConcatArrayHandle() = default;

  DataType dtype_;
  std::vector<Index> grid_shape_;
  std::vector<ArrayHandlePtr> cells_;
  // Start position of every block along each dimension, followed by the
  // composite extent.
  std::vector<std::vector<Index>> boundaries_;
  ChunkGrid chunk_grid_;
};

}  // namespace cubestack

#endif  // CUBESTACK_DRIVER_CONCAT_CONCAT_ARRAY_H_
