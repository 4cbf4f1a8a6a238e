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

#ifndef CUBESTACK_DRIVER_SUBSET_ARRAY_H_
#define CUBESTACK_DRIVER_SUBSET_ARRAY_H_

#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Returns a handle presenting the region `box` of `base` with origin zero.
///
/// Reads are translated by `box.origin()` and forwarded to `base`.  The chunk
/// grid is the grid of `base` clipped to `box`, so a view that starts inside
/// a physical chunk reports a non-zero grid offset.
///
/// \error `absl::StatusCode::kOutOfRange` if `box` is not contained in the
///     shape of `base`.
Result<ArrayHandlePtr> MakeSubsetArrayHandle(ArrayHandlePtr base,
                                             const Box& box);

/// Same as `MakeSubsetArrayHandle`, but writes are forwarded to `base` as
/// well.
Result<WritableArrayHandlePtr> MakeWritableSubsetArrayHandle(
    WritableArrayHandlePtr base, const Box& box);

/// Returns a handle with the data of `base` described by `chunk_grid`.
///
/// Only the chunk description changes; no data is read or rechunked.
///
/// \error `absl::StatusCode::kInvalidArgument` if `chunk_grid` does not
///     describe the shape of `base`.
Result<ArrayHandlePtr> MakeChunkView(ArrayHandlePtr base, ChunkGrid chunk_grid);

/// Returns a handle with a new dimension of extent 1 inserted at `dim`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `dim` is not in
///     `[0, base->rank()]`.
Result<ArrayHandlePtr> MakeNewAxisArrayHandle(ArrayHandlePtr base,
                                              DimensionIndex dim);

/// Returns a handle presenting position `index` of dimension `dim` of `base`,
/// with that dimension removed.
///
/// \error `absl::StatusCode::kOutOfRange` if `index` is outside dimension
///     `dim`.
Result<ArrayHandlePtr> MakeSliceArrayHandle(ArrayHandlePtr base,
                                            DimensionIndex dim, Index index);

}  // namespace cubestack

#endif  // CUBESTACK_DRIVER_SUBSET_ARRAY_H_
