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

#ifndef CUBESTACK_PERSIST_CHUNK_OFFSET_H_
#define CUBESTACK_PERSIST_CHUNK_OFFSET_H_

#include <string>
#include <string_view>
#include <vector>

#include "absl/container/btree_map.h"
#include "cubestack/array.h"
#include "cubestack/axis.h"
#include "cubestack/cube.h"
#include "cubestack/data_type.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Attribute of a stored axis variable holding the number of synthetic
/// positions written before logical index 0.
constexpr std::string_view kArrayOffsetAttribute = "_ARRAY_OFFSET";

/// Attribute of a stored axis variable holding the axis values, for axes
/// whose values are not stored as coordinate data.
constexpr std::string_view kArrayValuesAttribute = "_ARRAYVALUES";

/// Units attribute written for time axes.
constexpr std::string_view kTimeUnits = "seconds since 1970-01-01";

/// Chunk offset by axis name.
using ChunkOffsets = absl::btree_map<std::string, Index>;

/// Storage layout of one variable about to be persisted.
struct ArrayInfo {
  std::string name;
  DataType dtype;
  std::vector<std::string> axis_names;
  /// Logical shape, without offset padding.
  std::vector<Index> shape;
  /// Physical chunk shape.
  std::vector<Index> chunk_shape;
  /// Leading chunk offset along each axis.
  ChunkOffsets offsets;
  Attributes attributes;
};

/// Derives the storage layout of `cube` from its chunk grid.
ArrayInfo GetArrayInfo(std::string name, const Cube& cube);

/// Returns the chunk offset of every axis used by `infos`.
///
/// \error `ErrorKind::kChunkOffsetConflict` if two variables declare
///     different offsets for the same axis.
Result<ChunkOffsets> ReconcileChunkOffsets(span<const ArrayInfo> infos);

/// Coordinate variable of an axis, as written to storage.
struct StoredAxis {
  std::string name;
  /// One-dimensional `int64` or `float64` values, `offset` positions longer
  /// than the axis.
  SharedArray data;
  Attributes attributes;
};

/// Converts `axis` to its stored form, with `offset` synthetic positions
/// prepended by extending the values backwards with the first step.
///
/// Time axes are stored as seconds since the Unix epoch.  String axes are
/// stored as positions and their labels in `kArrayValuesAttribute`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `offset` is negative.
Result<StoredAxis> ArrayFromAxis(const Axis& axis, Index offset);

/// Returns the offset recorded in `attributes`, or 0.
///
/// \error `absl::StatusCode::kInvalidArgument` if the attribute is not a
///     non-negative integer.
Result<Index> GetArrayOffset(const Attributes& attributes);

/// Reconstructs an axis from its stored coordinate variable, dropping the
/// leading offset positions recorded in `attributes`.
///
/// \error `absl::StatusCode::kInvalidArgument` if `data` is not
///     one-dimensional, is shorter than the offset, or the labels in
///     `kArrayValuesAttribute` are malformed.
Result<Axis> AxisFromStored(std::string name, const SharedArray& data,
                            const Attributes& attributes);

}  // namespace cubestack

#endif  // CUBESTACK_PERSIST_CHUNK_OFFSET_H_
