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

#ifndef CUBESTACK_AXIS_H_
#define CUBESTACK_AXIS_H_

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "absl/time/time.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Coordinate values of an axis.
using AxisValues =
    std::variant<std::vector<std::int64_t>, std::vector<double>,
                 std::vector<absl::Time>, std::vector<std::string>>;

/// Describes how the values of an axis can be looked up.
enum class LookupKind {
  /// Evenly spaced numeric values with a non-zero step.
  kRegular,
  /// Numeric or time values that are not evenly spaced, in any order.
  kIrregular,
  /// Discrete labels.
  kCategorical,
  /// No coordinate data; the values are the positions `0, ..., n-1`.
  kNone,
};

std::string_view LookupKindName(LookupKind kind);
std::ostream& operator<<(std::ostream& os, LookupKind kind);

/// Returns the number of values.
Index AxisValuesSize(const AxisValues& values);

/// Returns the element type name: "int64", "float64", "time" or "string".
std::string_view AxisValuesTypeName(const AxisValues& values);

/// Returns `true` if `values` are non-decreasing.
bool IsNonDecreasing(const AxisValues& values);

/// Returns `true` if `values` are non-increasing.
bool IsNonIncreasing(const AxisValues& values);

/// Infers the lookup kind of coordinate values.
///
/// Strings are categorical.  Integers are regular if they have a constant
/// non-zero step; floating point values are regular if every value is
/// within a relative tolerance of the evenly spaced range between the first
/// and last value.  Times are never regular.  Numeric and time values that
/// are not regular are irregular, whether or not they are monotonic.  A
/// single numeric value is regular.
LookupKind InferLookupKind(const AxisValues& values);

/// Returns the concatenation of `parts` in the order given by `order`.
///
/// \error `absl::StatusCode::kInvalidArgument` if the parts do not all hold
///     the same element type.
Result<AxisValues> ConcatAxisValues(span<const AxisValues> parts,
                                    span<const Index> order);

/// Named dimension with ordered coordinate values.
///
/// Axes are immutable values; operations that change an axis return a new
/// one.
class Axis {
 public:
  Axis() = default;

  /// Constructs an axis, inferring the lookup kind from `values`.
  Axis(std::string name, AxisValues values);

  /// Constructs an axis with no coordinate data of the given length.
  static Axis Positional(std::string name, Index size);

  const std::string& name() const { return name_; }
  const AxisValues& values() const { return values_; }
  LookupKind lookup_kind() const { return lookup_kind_; }
  Index size() const { return AxisValuesSize(values_); }

  /// Returns `true` for numeric or time axes with monotonic values, and for
  /// axes without coordinate data.
  bool is_continuous() const {
    return lookup_kind_ != LookupKind::kCategorical;
  }

  /// Returns the values in `[start, start + size)`.
  ///
  /// \error `absl::StatusCode::kOutOfRange` if the range is invalid.
  Result<Axis> Slice(Index start, Index size) const;

  Axis WithName(std::string name) const;

  /// Returns a printable representation of the value at `i`.
  std::string FormatValue(Index i) const;

  friend bool operator==(const Axis& a, const Axis& b) {
    return a.name_ == b.name_ && a.lookup_kind_ == b.lookup_kind_ &&
           a.values_ == b.values_;
  }
  friend bool operator!=(const Axis& a, const Axis& b) { return !(a == b); }

  friend std::ostream& operator<<(std::ostream& os, const Axis& axis);

 private:
  std::string name_;
  AxisValues values_;
  LookupKind lookup_kind_ = LookupKind::kNone;
};

}  // namespace cubestack

#endif  // CUBESTACK_AXIS_H_
