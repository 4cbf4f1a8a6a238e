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

#ifndef CUBESTACK_CUBE_H_
#define CUBESTACK_CUBE_H_

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/btree_map.h"
#include <nlohmann/json.hpp>
#include "cubestack/array.h"
#include "cubestack/axis.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// String-keyed attribute mapping.  Always a JSON object.
using Attributes = ::nlohmann::json;

/// Half-open index range `[start, stop)` selected along a named axis.
struct AxisRange {
  std::string axis;
  Index start;
  Index stop;
};

/// Chunk extents by axis name.
using ChunkSizes = absl::btree_map<std::string, Index>;

/// Multi-dimensional variable: an ordered list of axes, a lazy data handle
/// whose shape matches the axis lengths, and attributes.
///
/// Cubes are immutable; every operation returns a new cube that shares the
/// data handle of the original.
class Cube {
 public:
  Cube() = default;

  /// Constructs a cube.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if `handle` is null, its
  ///     shape does not match the lengths of `axes`, axis names are not
  ///     unique, or `attributes` is not an object.
  static Result<Cube> Make(std::vector<Axis> axes, ArrayHandlePtr handle,
                           Attributes attributes = Attributes::object());

  const std::vector<Axis>& axes() const { return axes_; }
  const ArrayHandlePtr& handle() const { return handle_; }
  const Attributes& attributes() const { return attributes_; }

  DataType dtype() const { return handle_->dtype(); }
  DimensionIndex rank() const { return axes_.size(); }
  std::vector<Index> shape() const;
  ChunkGrid chunk_grid() const { return handle_->chunk_grid(); }

  /// Returns the position of the axis named `name`.
  std::optional<DimensionIndex> FindAxis(std::string_view name) const;

  std::vector<std::string> axis_names() const;

  /// Selects index ranges along the named axes.  Ranges naming axes the cube
  /// does not have are ignored.
  ///
  /// \error `absl::StatusCode::kOutOfRange` if a range is invalid.
  Result<Cube> Subset(span<const AxisRange> ranges) const;

  /// Re-describes the chunking along the named axes.  Axes not named keep
  /// their chunking.  No data is read.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if a chunk size is not
  ///     positive.
  Result<Cube> WithChunkSizes(const ChunkSizes& chunk_sizes) const;

  /// Reads the full cube into memory.
  Result<SharedArray> Read() const;

  /// Returns the number of bytes of the full cube.
  Index num_bytes() const;

  friend std::ostream& operator<<(std::ostream& os, const Cube& cube);

 private:
  std::vector<Axis> axes_;
  ArrayHandlePtr handle_;
  Attributes attributes_ = Attributes::object();
};

/// Returns `attributes` with the members of `other` added, overwriting
/// members with the same key.
Attributes MergeAttributes(Attributes attributes, const Attributes& other);

}  // namespace cubestack

#endif  // CUBESTACK_CUBE_H_
