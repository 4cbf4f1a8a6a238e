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

#ifndef CUBESTACK_DATA_TYPE_H_
#define CUBESTACK_DATA_TYPE_H_

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>

#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

// CUBESTACK_FOR_EACH_DATA_TYPE(X) instantiates X(T, id, name) for each
// supported element type.
#define CUBESTACK_FOR_EACH_DATA_TYPE(X)  \
  X(std::uint8_t, uint8_t, "uint8")      \
  X(std::int16_t, int16_t, "int16")      \
  X(std::int32_t, int32_t, "int32")      \
  X(std::int64_t, int64_t, "int64")      \
  X(float, float32_t, "float32")         \
  X(double, float64_t, "float64")        \
  /**/

enum class DataTypeId {
#define CUBESTACK_INTERNAL_DATA_TYPE_ID(T, id, name) id,
  CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_DATA_TYPE_ID)
#undef CUBESTACK_INTERNAL_DATA_TYPE_ID
};

/// Run-time representation of an array element type.
///
/// Each data type has a missing-value sentinel used to fill array regions
/// with no backing data: quiet NaN for floating point types, and the maximum
/// representable value for integer types.
class DataType {
 public:
  constexpr DataType() = default;
  constexpr explicit DataType(DataTypeId id) : id_(id), valid_(true) {}

  bool valid() const { return valid_; }
  DataTypeId id() const { return id_; }

  /// Returns the element size in bytes.
  std::ptrdiff_t size() const;

  /// Returns the canonical name, e.g. "float32".
  std::string_view name() const;

  /// Writes `count` missing-value sentinels starting at `ptr`.
  void FillMissing(void* ptr, Index count) const;

  /// Returns `true` if the element at `ptr` equals the sentinel.  NaN
  /// elements of floating point types are always missing.
  bool IsMissing(const void* ptr) const;

  friend bool operator==(DataType a, DataType b) {
    return a.valid_ == b.valid_ && (!a.valid_ || a.id_ == b.id_);
  }
  friend bool operator!=(DataType a, DataType b) { return !(a == b); }

  friend std::ostream& operator<<(std::ostream& os, DataType dtype);

 private:
  DataTypeId id_ = DataTypeId::uint8_t;
  bool valid_ = false;
};

template <typename T>
constexpr DataType dtype_v = DataType();

#define CUBESTACK_INTERNAL_DEFINE_DTYPE_V(T, id, name) \
  template <>                                          \
  constexpr DataType dtype_v<T> = DataType(DataTypeId::id);
CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_DEFINE_DTYPE_V)
#undef CUBESTACK_INTERNAL_DEFINE_DTYPE_V

/// Parses a canonical data type name.
Result<DataType> GetDataType(std::string_view name);

}  // namespace cubestack

#endif  // CUBESTACK_DATA_TYPE_H_
