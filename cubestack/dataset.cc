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

#include "cubestack/dataset.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include <nlohmann/json.hpp>
#include "cubestack/axis.h"
#include "cubestack/config.h"
#include "cubestack/cube.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/concat/concat_array.h"
#include "cubestack/driver/memory/memory_array.h"
#include "cubestack/driver/subset_array.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

std::string FormatBytes(double bytes) {
  static constexpr const char* kUnits[] = {"bytes", "KB", "MB", "GB", "TB"};
  int unit = 0;
  while (bytes >= 1024 && unit < 4) {
    bytes /= 1024;
    ++unit;
  }
  if (unit == 0) return absl::StrCat(static_cast<Index>(bytes), " bytes");
  return absl::StrFormat("%.2f %s", bytes, kUnits[unit]);
}

void PrintAxes(std::ostream& os, const std::vector<const Axis*>& axes,
               std::string_view indent) {
  for (const Axis* axis : axes) os << indent << *axis << "\n";
}

}  // namespace

Result<Dataset> Dataset::Make(std::vector<Variable> variables,
                              Attributes properties) {
  if (!properties.is_object()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Properties must be an object, but received: ", properties.dump()));
  }
  Dataset dataset;
  absl::flat_hash_set<std::string> names;
  for (const auto& [name, cube] : variables) {
    if (!names.insert(name).second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate variable name \"", name, "\""));
    }
    for (const Axis& axis : cube.axes()) {
      auto [it, inserted] = dataset.axes_.emplace(axis.name(), axis);
      if (!inserted && it->second != axis) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Variable ", name, " has axis ", axis.name(),
            " that differs from the axis of the same name in other "
            "variables"));
      }
    }
  }
  dataset.variables_ = std::move(variables);
  dataset.properties_ = std::move(properties);
  return dataset;
}

std::vector<std::string> Dataset::variable_names() const {
  std::vector<std::string> names;
  names.reserve(variables_.size());
  for (const auto& v : variables_) names.push_back(v.first);
  return names;
}

const Cube* Dataset::FindCube(std::string_view name) const {
  for (const auto& v : variables_) {
    if (v.first == name) return &v.second;
  }
  return nullptr;
}

Result<Cube> Dataset::GetCube(std::string_view name) const {
  if (const Cube* cube = FindCube(name)) return *cube;
  return absl::NotFoundError(absl::StrCat("Variable ", name, " not found"));
}

Result<Axis> Dataset::GetAxis(std::string_view name) const {
  auto it = axes_.find(name);
  if (it == axes_.end()) {
    return absl::NotFoundError(absl::StrCat("Axis ", name, " not found"));
  }
  return it->second;
}

Result<Dataset> Dataset::Select(span<const std::string> names) const {
  std::vector<Variable> selected;
  for (const auto& name : names) {
    const std::string prefix = absl::AsciiStrToLower(name);
    const Variable* match = nullptr;
    size_t num_matches = 0;
    for (const auto& v : variables_) {
      if (absl::StartsWith(absl::AsciiStrToLower(v.first), prefix)) {
        match = &v;
        ++num_matches;
      }
    }
    if (num_matches != 1) {
      return absl::NotFoundError(absl::StrCat("Name ", name, " not found"));
    }
    selected.push_back(*match);
  }
  return Make(std::move(selected), properties_);
}

Result<Dataset> Dataset::Subset(span<const AxisRange> ranges) const {
  std::vector<Variable> variables;
  variables.reserve(variables_.size());
  for (const auto& [name, cube] : variables_) {
    CUBESTACK_ASSIGN_OR_RETURN(
        auto subset, cube.Subset(ranges),
        MaybeAnnotateStatus(_, absl::StrCat("Subsetting variable ", name)));
    variables.emplace_back(name, std::move(subset));
  }
  return Make(std::move(variables), properties_);
}

Result<Dataset> Dataset::SetChunks(const ChunkSizes& chunk_sizes) const {
  absl::btree_map<std::string, ChunkSizes> per_variable;
  for (const auto& v : variables_) per_variable[v.first] = chunk_sizes;
  return SetChunks(per_variable);
}

Result<Dataset> Dataset::SetChunks(
    const absl::btree_map<std::string, ChunkSizes>& chunk_sizes) const {
  std::vector<Variable> variables = variables_;
  for (auto& [name, cube] : variables) {
    auto it = chunk_sizes.find(name);
    if (it == chunk_sizes.end()) continue;
    CUBESTACK_ASSIGN_OR_RETURN(
        cube, cube.WithChunkSizes(it->second),
        MaybeAnnotateStatus(_, absl::StrCat("Rechunking variable ", name)));
  }
  return Make(std::move(variables), properties_);
}

std::ostream& operator<<(std::ostream& os, const Dataset& dataset) {
  // Axes shared by all variables, in the order of the first variable.
  std::vector<const Axis*> shared;
  if (!dataset.variables_.empty()) {
    for (const Axis& axis : dataset.variables_.front().second.axes()) {
      bool everywhere = true;
      for (const auto& v : dataset.variables_) {
        if (!v.second.FindAxis(axis.name())) {
          everywhere = false;
          break;
        }
      }
      if (everywhere) shared.push_back(&axis);
    }
  }
  std::vector<std::string> shared_only;
  std::vector<std::pair<std::vector<const Axis*>, std::vector<std::string>>>
      groups;
  for (const auto& [name, cube] : dataset.variables_) {
    std::vector<const Axis*> additional;
    for (const Axis& axis : cube.axes()) {
      if (std::none_of(shared.begin(), shared.end(), [&](const Axis* a) {
            return a->name() == axis.name();
          })) {
        additional.push_back(&axis);
      }
    }
    if (additional.empty()) {
      shared_only.push_back(name);
      continue;
    }
    auto it = std::find_if(groups.begin(), groups.end(), [&](const auto& g) {
      return std::equal(g.first.begin(), g.first.end(), additional.begin(),
                        additional.end(),
                        [](const Axis* a, const Axis* b) { return *a == *b; });
    });
    if (it == groups.end()) {
      groups.emplace_back(std::move(additional),
                          std::vector<std::string>{name});
    } else {
      it->second.push_back(name);
    }
  }
  std::stable_sort(groups.begin(), groups.end(),
                   [](const auto& a, const auto& b) {
                     return a.second.size() < b.second.size();
                   });

  os << "Dataset\n";
  os << "Shared Axes:\n";
  if (shared.empty()) {
    os << "  None\n";
  } else {
    PrintAxes(os, shared, "  ");
  }
  if (!shared_only.empty()) {
    std::sort(shared_only.begin(), shared_only.end());
    os << "Variables:\n" << absl::StrJoin(shared_only, ", ") << "\n";
  }
  if (!groups.empty()) {
    os << "Variables with additional axes:\n";
    for (auto& [axes, names] : groups) {
      os << "  Additional Axes:\n";
      PrintAxes(os, axes, "    ");
      std::sort(names.begin(), names.end());
      os << "  Variables:\n  " << absl::StrJoin(names, ", ") << "\n";
    }
  }
  if (!dataset.properties_.empty()) {
    os << "Properties: " << dataset.properties_.dump() << "\n";
  }
  return os;
}

Result<Dataset> ToDataset(const Cube& cube, std::string_view dataset_axis,
                          std::string_view layer_name) {
  const auto dim = cube.FindAxis(dataset_axis);
  if (!dim) {
    std::vector<Dataset::Variable> variables;
    variables.emplace_back(std::string(layer_name), cube);
    return Dataset::Make(std::move(variables));
  }
  std::vector<Axis> axes = cube.axes();
  const Axis group_axis = axes[*dim];
  axes.erase(axes.begin() + *dim);

  std::vector<Dataset::Variable> variables;
  for (Index i = 0; i < group_axis.size(); ++i) {
    CUBESTACK_ASSIGN_OR_RETURN(auto handle,
                               MakeSliceArrayHandle(cube.handle(), *dim, i));
    CUBESTACK_ASSIGN_OR_RETURN(
        auto layer, Cube::Make(axes, std::move(handle), cube.attributes()));
    variables.emplace_back(group_axis.FormatValue(i), std::move(layer));
  }
  // Position of each original axis when the split axis is appended last.
  const DimensionIndex n = axes.size();
  ::nlohmann::json perm = ::nlohmann::json::array();
  for (DimensionIndex i = 0; i < *dim; ++i) perm.push_back(i);
  perm.push_back(n);
  for (DimensionIndex i = *dim; i < n; ++i) perm.push_back(i);
  Attributes properties = Attributes::object();
  properties[std::string(kCubePermProperty)] = std::move(perm);
  return Dataset::Make(std::move(variables), std::move(properties));
}

Result<Cube> ToCube(const Dataset& dataset, std::string_view join_name) {
  if (dataset.num_variables() == 1) return dataset.variables()[0].second;
  std::vector<const Dataset::Variable*> to_join;
  for (const auto& v : dataset.variables()) {
    const bool spans_all = std::all_of(
        dataset.axes().begin(), dataset.axes().end(),
        [&](const auto& a) { return v.second.FindAxis(a.first).has_value(); });
    if (spans_all) to_join.push_back(&v);
  }
  if (to_join.empty()) {
    return absl::InvalidArgumentError(
        "No variable spans all axes of the dataset");
  }
  if (to_join.size() == 1) return to_join[0]->second;

  const Cube& first = to_join[0]->second;
  std::vector<std::string> labels;
  std::vector<ArrayHandlePtr> cells;
  for (const auto* v : to_join) {
    const Cube& cube = v->second;
    if (cube.dtype() != first.dtype()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Cannot join variable ", v->first, " of type ", cube.dtype().name(),
          " with variables of type ", first.dtype().name()));
    }
    if (cube.axes() != first.axes()) {
      return MakeError(
          ErrorKind::kShapeMismatch,
          absl::StrCat("Variable ", v->first, " has axes {",
                       absl::StrJoin(cube.axis_names(), ", "),
                       "} but expected {",
                       absl::StrJoin(first.axis_names(), ", "), "}"));
    }
    CUBESTACK_ASSIGN_OR_RETURN(
        auto cell, MakeNewAxisArrayHandle(cube.handle(), cube.rank()));
    cells.push_back(std::move(cell));
    labels.push_back(v->first);
  }
  std::vector<Index> grid_shape(first.rank() + 1, 1);
  grid_shape.back() = cells.size();
  CUBESTACK_ASSIGN_OR_RETURN(auto handle,
                             ConcatArrayHandle::Make(grid_shape, cells));
  std::vector<Axis> axes = first.axes();
  axes.emplace_back(std::string(join_name), std::move(labels));
  Attributes attributes = first.attributes();
  attributes.erase("name");
  return Cube::Make(std::move(axes), std::move(handle), std::move(attributes));
}

Result<Dataset> ReadDataset(const Dataset& dataset, const Config& config) {
  double total_bytes = 0;
  for (const auto& v : dataset.variables()) total_bytes += v.second.num_bytes();
  if (total_bytes > config.max_cache_bytes) {
    ABSL_LOG(WARNING) << "Loading data of size " << FormatBytes(total_bytes);
  }
  std::vector<Dataset::Variable> variables;
  for (const auto& [name, cube] : dataset.variables()) {
    CUBESTACK_ASSIGN_OR_RETURN(
        auto data, cube.Read(),
        MaybeAnnotateStatus(_, absl::StrCat("Reading variable ", name)));
    CUBESTACK_ASSIGN_OR_RETURN(
        auto handle, MemoryArrayHandle::Make(data, cube.chunk_grid()));
    CUBESTACK_ASSIGN_OR_RETURN(
        auto in_memory,
        Cube::Make(cube.axes(), std::move(handle), cube.attributes()));
    variables.emplace_back(name, std::move(in_memory));
  }
  return Dataset::Make(std::move(variables), dataset.properties());
}

}  // namespace cubestack
