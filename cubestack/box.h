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

#ifndef CUBESTACK_BOX_H_
#define CUBESTACK_BOX_H_

#include <iosfwd>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "cubestack/index.h"

namespace cubestack {

/// Half-open rectangular region `[origin, origin + shape)` of an index space.
///
/// Boxes address reads and writes of `ArrayHandle` objects; the index space of
/// every handle starts at zero.
class Box {
 public:
  Box() = default;

  /// Constructs the box `[0, shape)`.
  explicit Box(std::vector<Index> shape)
      : origin_(shape.size(), 0), shape_(std::move(shape)) {}

  Box(std::vector<Index> origin, std::vector<Index> shape)
      : origin_(std::move(origin)), shape_(std::move(shape)) {}

  DimensionIndex rank() const { return shape_.size(); }

  span<const Index> origin() const { return origin_; }
  span<const Index> shape() const { return shape_; }

  Index origin(DimensionIndex dim) const { return origin_[dim]; }
  Index shape(DimensionIndex dim) const { return shape_[dim]; }
  Index exclusive_max(DimensionIndex dim) const {
    return origin_[dim] + shape_[dim];
  }

  void set_interval(DimensionIndex dim, Index origin, Index size) {
    origin_[dim] = origin;
    shape_[dim] = size;
  }

  /// Returns the product of the extents.
  Index num_elements() const;

  bool is_empty() const { return num_elements() == 0; }

  friend bool operator==(const Box& a, const Box& b) {
    return a.origin_ == b.origin_ && a.shape_ == b.shape_;
  }
  friend bool operator!=(const Box& a, const Box& b) { return !(a == b); }

  friend std::ostream& operator<<(std::ostream& os, const Box& box);

 private:
  std::vector<Index> origin_;
  std::vector<Index> shape_;
};

/// Returns the product of `shape`.
Index ProductOfExtents(span<const Index> shape);

/// Checks that `box` has the rank of `shape` and lies within `[0, shape)`.
absl::Status ValidateBoxWithinShape(const Box& box, span<const Index> shape);

}  // namespace cubestack

#endif  // CUBESTACK_BOX_H_
