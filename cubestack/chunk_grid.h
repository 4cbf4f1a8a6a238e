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

#ifndef CUBESTACK_CHUNK_GRID_H_
#define CUBESTACK_CHUNK_GRID_H_

#include <iosfwd>
#include <utility>
#include <vector>

#include "cubestack/box.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Describes how an array is divided into chunks.
///
/// The grid is the Cartesian product of one list of chunk extents per
/// dimension; the chunk extents along a dimension sum to the array extent.
/// Chunks may be irregular, which arises when arrays with different native
/// chunking are concatenated, or when a view starts in the middle of a
/// physical chunk.
class ChunkGrid {
 public:
  ChunkGrid() = default;

  /// Constructs a grid from explicit per-dimension chunk extents.
  explicit ChunkGrid(std::vector<std::vector<Index>> extents)
      : extents_(std::move(extents)) {}

  /// Returns a regular grid with chunks of `chunk_shape`, shifted so that the
  /// first physical chunk boundary lies `offset[i]` positions before index 0.
  ///
  /// \param offset Empty, or one value per dimension in `[0, chunk_shape[i])`.
  static Result<ChunkGrid> Regular(span<const Index> shape,
                                   span<const Index> chunk_shape,
                                   span<const Index> offset = {});

  /// Returns a grid with a single chunk covering `shape`.
  static ChunkGrid SingleChunk(span<const Index> shape);

  DimensionIndex rank() const { return extents_.size(); }

  /// Chunk extents along `dim`.
  span<const Index> extents(DimensionIndex dim) const {
    return extents_[dim];
  }

  Index num_chunks(DimensionIndex dim) const { return extents_[dim].size(); }

  /// Array extent along each dimension.
  std::vector<Index> shape() const;

  /// Start position of every chunk along `dim`, followed by the extent.
  std::vector<Index> boundaries(DimensionIndex dim) const;

  /// Nominal chunk extent along `dim`: the largest chunk extent.
  Index approx_chunk_size(DimensionIndex dim) const;

  /// Number of positions by which the first physical chunk along `dim`
  /// starts before index 0.
  ///
  /// For a grid with more than one chunk this is the difference between the
  /// nominal chunk extent and the extent of the first chunk; otherwise zero.
  Index grid_offset(DimensionIndex dim) const;

  std::vector<Index> approx_chunk_shape() const;
  std::vector<Index> grid_offsets() const;

  /// Returns the grid restricted to `box`, with chunks clipped at its edges.
  Result<ChunkGrid> Subset(const Box& box) const;

  /// Concatenates `grids` along `dim`.  All grids must have the same rank;
  /// for dimensions other than `dim` the first grid's extents are used.
  static Result<ChunkGrid> Concatenate(span<const ChunkGrid> grids,
                                       DimensionIndex dim);

  friend bool operator==(const ChunkGrid& a, const ChunkGrid& b) {
    return a.extents_ == b.extents_;
  }
  friend bool operator!=(const ChunkGrid& a, const ChunkGrid& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& os, const ChunkGrid& grid);

 private:
  std::vector<std::vector<Index>> extents_;
};

}  // namespace cubestack

#endif  // CUBESTACK_CHUNK_GRID_H_
