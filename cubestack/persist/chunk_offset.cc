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

#include "cubestack/persist/chunk_offset.h"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include <nlohmann/json.hpp>
#include "cubestack/array.h"
#include "cubestack/axis.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/cube.h"
#include "cubestack/data_type.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/internal/json/json.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

/// Returns `values` preceded by `n` positions continuing the first step
/// backwards.
template <typename T>
std::vector<T> PrependRange(const std::vector<T>& values, Index n) {
  if (n == 0) return values;
  const T step = values.size() >= 2 ? values[1] - values[0] : T(1);
  const T first = values.empty() ? T(0) : values[0];
  std::vector<T> result;
  result.reserve(n + values.size());
  for (Index i = n; i > 0; --i) result.push_back(first - step * T(i));
  result.insert(result.end(), values.begin(), values.end());
  return result;
}

/// Returns the elements of the one-dimensional `data` after the first
/// `offset`, converted to `Target`.
template <typename Target>
std::vector<Target> ConvertValues(const SharedArray& data, Index offset) {
  std::vector<Target> values;
  switch (data.dtype().id()) {
#define CUBESTACK_INTERNAL_CONVERT_VALUES(T, id, name)                 \
  case DataTypeId::id: {                                               \
    const auto all = data.ToVector<T>();                               \
    for (auto it = all.begin() + offset; it != all.end(); ++it) {      \
      values.push_back(static_cast<Target>(*it));                      \
    }                                                                  \
    break;                                                             \
  }
    CUBESTACK_FOR_EACH_DATA_TYPE(CUBESTACK_INTERNAL_CONVERT_VALUES)
#undef CUBESTACK_INTERNAL_CONVERT_VALUES
  }
  return values;
}

bool IsFloatingPoint(DataType dtype) {
  return dtype == dtype_v<float> || dtype == dtype_v<double>;
}

Result<AxisValues> ParseArrayValues(const ::nlohmann::json& j) {
  if (!j.is_array()) {
    return internal_json::ExpectedError(j, "array");
  }
  if (std::all_of(j.begin(), j.end(),
                  [](const auto& v) { return v.is_string(); })) {
    return AxisValues(j.get<std::vector<std::string>>());
  }
  if (std::all_of(j.begin(), j.end(),
                  [](const auto& v) { return v.is_number_integer(); })) {
    return AxisValues(j.get<std::vector<std::int64_t>>());
  }
  if (std::all_of(j.begin(), j.end(),
                  [](const auto& v) { return v.is_number(); })) {
    return AxisValues(j.get<std::vector<double>>());
  }
  return internal_json::ExpectedError(j, "array of strings or numbers");
}

}  // namespace

ArrayInfo GetArrayInfo(std::string name, const Cube& cube) {
  const ChunkGrid grid = cube.chunk_grid();
  ArrayInfo info;
  info.name = std::move(name);
  info.dtype = cube.dtype();
  info.axis_names = cube.axis_names();
  info.shape = cube.shape();
  info.chunk_shape = grid.approx_chunk_shape();
  for (DimensionIndex i = 0; i < cube.rank(); ++i) {
    info.offsets[info.axis_names[i]] = grid.grid_offset(i);
  }
  info.attributes = cube.attributes();
  return info;
}

Result<ChunkOffsets> ReconcileChunkOffsets(span<const ArrayInfo> infos) {
  ChunkOffsets offsets;
  absl::btree_map<std::string, std::string_view> declared_by;
  for (const auto& info : infos) {
    for (const auto& [axis, offset] : info.offsets) {
      auto [it, inserted] = offsets.emplace(axis, offset);
      if (inserted) {
        declared_by[axis] = info.name;
        continue;
      }
      if (it->second != offset) {
        return MakeError(
            ErrorKind::kChunkOffsetConflict,
            absl::StrCat("Variable ", info.name, " has chunk offset ", offset,
                         " along axis ", axis, " but variable ",
                         declared_by[axis], " has chunk offset ",
                         it->second));
      }
    }
  }
  return offsets;
}

Result<StoredAxis> ArrayFromAxis(const Axis& axis, Index offset) {
  if (offset < 0) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid chunk offset ", offset, " for axis ", axis.name()));
  }
  StoredAxis stored;
  stored.name = axis.name();
  stored.attributes = Attributes::object();
  std::visit(
      [&](const auto& values) {
        using T = typename std::decay_t<decltype(values)>::value_type;
        if constexpr (std::is_same_v<T, absl::Time>) {
          std::vector<std::int64_t> seconds;
          seconds.reserve(values.size());
          for (const auto& t : values) {
            seconds.push_back(absl::ToUnixSeconds(t));
          }
          stored.data = MakeArray(PrependRange(seconds, offset));
          stored.attributes["units"] = std::string(kTimeUnits);
        } else if constexpr (std::is_same_v<T, std::string>) {
          std::vector<std::int64_t> positions(values.size());
          for (size_t i = 0; i < positions.size(); ++i) positions[i] = i;
          stored.data = MakeArray(PrependRange(positions, offset));
          stored.attributes[std::string(kArrayValuesAttribute)] = values;
        } else {
          stored.data = MakeArray(PrependRange(values, offset));
        }
      },
      axis.values());
  stored.attributes[std::string(kArrayOffsetAttribute)] = offset;
  return stored;
}

Result<Index> GetArrayOffset(const Attributes& attributes) {
  auto it = attributes.find(std::string(kArrayOffsetAttribute));
  if (it == attributes.end()) return 0;
  auto offset = internal_json::JsonValueAsInteger(*it);
  if (!offset || *offset < 0) {
    return MaybeAnnotateStatus(
        internal_json::ExpectedError(*it, "non-negative integer"),
        absl::StrCat("Error parsing attribute \"", kArrayOffsetAttribute,
                     "\""));
  }
  return *offset;
}

Result<Axis> AxisFromStored(std::string name, const SharedArray& data,
                            const Attributes& attributes) {
  if (data.rank() != 1) {
    return absl::InvalidArgumentError(
        absl::StrCat("Coordinate variable ", name, " has rank ", data.rank(),
                     " but must have rank 1"));
  }
  CUBESTACK_ASSIGN_OR_RETURN(
      const Index offset, GetArrayOffset(attributes),
      MaybeAnnotateStatus(_, absl::StrCat("Reading axis ", name)));
  if (offset > data.shape()[0]) {
    return absl::InvalidArgumentError(
        absl::StrCat("Axis ", name, " has chunk offset ", offset,
                     " but only ", data.shape()[0], " stored values"));
  }
  auto it = attributes.find(std::string(kArrayValuesAttribute));
  if (it != attributes.end()) {
    CUBESTACK_ASSIGN_OR_RETURN(
        auto values, ParseArrayValues(*it),
        MaybeAnnotateStatus(_, absl::StrCat("Error parsing attribute \"",
                                            kArrayValuesAttribute,
                                            "\" of axis ", name)));
    return Axis(std::move(name), std::move(values));
  }
  auto units = attributes.find("units");
  if (units != attributes.end() && units->is_string() &&
      units->get<std::string>() == kTimeUnits) {
    std::vector<absl::Time> times;
    for (double s : ConvertValues<double>(data, offset)) {
      times.push_back(absl::UnixEpoch() + absl::Seconds(s));
    }
    return Axis(std::move(name), std::move(times));
  }
  if (IsFloatingPoint(data.dtype())) {
    return Axis(std::move(name), ConvertValues<double>(data, offset));
  }
  return Axis(std::move(name), ConvertValues<std::int64_t>(data, offset));
}

}  // namespace cubestack
