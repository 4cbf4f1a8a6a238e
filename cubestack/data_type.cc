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

#include "cubestack/data_type.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>
#include <ostream>
#include <string_view>
#include <type_traits>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "cubestack/index.h"

namespace cubestack {
namespace {

template <typename T>
constexpr T MissingValue() {
  if constexpr (std::is_floating_point_v<T>) {
    return std::numeric_limits<T>::quiet_NaN();
  } else {
    return std::numeric_limits<T>::max();
  }
}

template <typename T>
bool IsMissingValue(const void* ptr) {
  T value;
  std::memcpy(&value, ptr, sizeof(T));
  if constexpr (std::is_floating_point_v<T>) {
    return std::isnan(value);
  } else {
    return value == MissingValue<T>();
  }
}

}  // namespace

std::ptrdiff_t DataType::size() const {
  switch (id_) {
#define CUBESTACK_INTERNAL_DTYPE_SIZE(T, id, name) \
  case DataTypeId::id:                             \
    return sizeof(T);
    CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_DTYPE_SIZE)
#undef CUBESTACK_INTERNAL_DTYPE_SIZE
  }
  return 0;
}

std::string_view DataType::name() const {
  if (!valid_) return "<unspecified>";
  switch (id_) {
#define CUBESTACK_INTERNAL_DTYPE_NAME(T, id, name) \
  case DataTypeId::id:                             \
    return name;
    CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_DTYPE_NAME)
#undef CUBESTACK_INTERNAL_DTYPE_NAME
  }
  return "<unknown>";
}

void DataType::FillMissing(void* ptr, Index count) const {
  switch (id_) {
#define CUBESTACK_INTERNAL_DTYPE_FILL(T, id, name) \
  case DataTypeId::id:                             \
    std::fill_n(static_cast<T*>(ptr), count, MissingValue<T>()); \
    return;
    CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_DTYPE_FILL)
#undef CUBESTACK_INTERNAL_DTYPE_FILL
  }
}

bool DataType::IsMissing(const void* ptr) const {
  switch (id_) {
#define CUBESTACK_INTERNAL_DTYPE_IS_MISSING(T, id, name) \
  case DataTypeId::id:                                   \
    return IsMissingValue<T>(ptr);
    CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_DTYPE_IS_MISSING)
#undef CUBESTACK_INTERNAL_DTYPE_IS_MISSING
  }
  return false;
}

std::ostream& operator<<(std::ostream& os, DataType dtype) {
  return os << dtype.name();
}

Result<DataType> GetDataType(std::string_view name) {
#define CUBESTACK_INTERNAL_DTYPE_PARSE(T, id, dtype_name) \
  if (name == dtype_name) return dtype_v<T>;
  CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_DTYPE_PARSE)
#undef CUBESTACK_INTERNAL_DTYPE_PARSE
  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported data type: \"", name, "\""));
}

}  // namespace cubestack
