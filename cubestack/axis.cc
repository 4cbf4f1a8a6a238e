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

#include "cubestack/axis.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {
namespace {

// Relative tolerance used to recognize evenly spaced floating point values.
constexpr double kRangeTolerance = 1.4901161193847656e-08;  // sqrt(eps)

template <typename T>
bool IsRegular(const std::vector<T>& values) {
  if constexpr (std::is_same_v<T, std::int64_t>) {
    if (values.size() == 1) return true;
    if (values.size() < 2) return false;
    const std::int64_t step = values[1] - values[0];
    if (step == 0) return false;
    for (size_t i = 2; i < values.size(); ++i) {
      if (values[i] - values[i - 1] != step) return false;
    }
    return true;
  } else if constexpr (std::is_same_v<T, double>) {
    if (values.size() == 1) return std::isfinite(values[0]);
    if (values.size() < 2) return false;
    const double first = values.front();
    const double last = values.back();
    if (!(first != last) || !std::isfinite(first) || !std::isfinite(last)) {
      return false;
    }
    const double n = values.size() - 1;
    for (size_t i = 0; i < values.size(); ++i) {
      const double expected = first + (last - first) * (i / n);
      const double diff = std::abs(values[i] - expected);
      if (!(diff <= kRangeTolerance *
                        std::max(std::abs(values[i]), std::abs(expected)))) {
        return false;
      }
    }
    return true;
  } else {
    return false;
  }
}

template <typename T>
std::string FormatElement(const T& value) {
  if constexpr (std::is_same_v<T, absl::Time>) {
    return absl::FormatTime(absl::RFC3339_sec, value, absl::UTCTimeZone());
  } else if constexpr (std::is_same_v<T, std::string>) {
    return value;
  } else {
    return absl::StrCat(value);
  }
}

}  // namespace

std::string_view LookupKindName(LookupKind kind) {
  switch (kind) {
    case LookupKind::kRegular:
      return "regular";
    case LookupKind::kIrregular:
      return "irregular";
    case LookupKind::kCategorical:
      return "categorical";
    case LookupKind::kNone:
      return "none";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, LookupKind kind) {
  return os << LookupKindName(kind);
}

Index AxisValuesSize(const AxisValues& values) {
  return std::visit([](const auto& v) { return static_cast<Index>(v.size()); },
                    values);
}

std::string_view AxisValuesTypeName(const AxisValues& values) {
  switch (values.index()) {
    case 0:
      return "int64";
    case 1:
      return "float64";
    case 2:
      return "time";
    default:
      return "string";
  }
}

bool IsNonDecreasing(const AxisValues& values) {
  return std::visit(
      [](const auto& v) {
        return std::is_sorted(v.begin(), v.end());
      },
      values);
}

bool IsNonIncreasing(const AxisValues& values) {
  return std::visit(
      [](const auto& v) {
        return std::is_sorted(v.rbegin(), v.rend());
      },
      values);
}

LookupKind InferLookupKind(const AxisValues& values) {
  if (std::holds_alternative<std::vector<std::string>>(values)) {
    return LookupKind::kCategorical;
  }
  if (std::visit([](const auto& v) { return IsRegular(v); }, values)) {
    return LookupKind::kRegular;
  }
  return LookupKind::kIrregular;
}

Result<AxisValues> ConcatAxisValues(span<const AxisValues> parts,
                                    span<const Index> order) {
  if (parts.empty()) {
    return absl::InvalidArgumentError("Cannot concatenate zero value lists");
  }
  for (const auto& part : parts) {
    if (part.index() != parts[0].index()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Cannot concatenate ", AxisValuesTypeName(part), " values with ",
          AxisValuesTypeName(parts[0]), " values"));
    }
  }
  return std::visit(
      [&](const auto& first) -> AxisValues {
        using Vector = std::decay_t<decltype(first)>;
        Vector result;
        for (Index i : order) {
          const auto& part = std::get<Vector>(parts[i]);
          result.insert(result.end(), part.begin(), part.end());
        }
        return result;
      },
      parts[0]);
}

Axis::Axis(std::string name, AxisValues values)
    : name_(std::move(name)),
      values_(std::move(values)),
      lookup_kind_(InferLookupKind(values_)) {}

Axis Axis::Positional(std::string name, Index size) {
  std::vector<std::int64_t> positions(size);
  for (Index i = 0; i < size; ++i) positions[i] = i;
  Axis axis;
  axis.name_ = std::move(name);
  axis.values_ = std::move(positions);
  axis.lookup_kind_ = LookupKind::kNone;
  return axis;
}

Result<Axis> Axis::Slice(Index start, Index size) const {
  if (start < 0 || size < 0 || start + size > this->size()) {
    return absl::OutOfRangeError(
        absl::StrCat("Range [", start, ", ", start + size, ") is outside axis ",
                     name_, " of length ", this->size()));
  }
  AxisValues values = std::visit(
      [&](const auto& v) -> AxisValues {
        using Vector = std::decay_t<decltype(v)>;
        return Vector(v.begin() + start, v.begin() + start + size);
      },
      values_);
  if (lookup_kind_ == LookupKind::kNone) {
    Axis axis = Positional(name_, size);
    axis.values_ = std::move(values);
    return axis;
  }
  return Axis(name_, std::move(values));
}

Axis Axis::WithName(std::string name) const {
  Axis axis = *this;
  axis.name_ = std::move(name);
  return axis;
}

std::string Axis::FormatValue(Index i) const {
  return std::visit([&](const auto& v) { return FormatElement(v[i]); },
                    values_);
}

std::ostream& operator<<(std::ostream& os, const Axis& axis) {
  os << axis.name_ << " " << axis.lookup_kind_ << " "
     << AxisValuesTypeName(axis.values_) << "[" << axis.size() << "]";
  const Index n = axis.size();
  if (n > 0) {
    os << " " << axis.FormatValue(0);
    if (n > 1) os << ":" << axis.FormatValue(n - 1);
  }
  return os;
}

}  // namespace cubestack
