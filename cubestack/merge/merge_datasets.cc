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

#include "cubestack/merge/merge_datasets.h"

#include <cstdint>
#include <numeric>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/axis.h"
#include "cubestack/cube.h"
#include "cubestack/dataset.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/concat/concat_array.h"
#include "cubestack/driver/subset_array.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/internal/log/verbose_flag.h"
#include "cubestack/merge/axis_join.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag merge_logging("merge");

/// Returns the names of the variables present in every source, in the order
/// of the first source, and warns about the others.
std::vector<std::string> SharedVariableNames(span<const Dataset> sources) {
  absl::btree_map<std::string, size_t> counts;
  for (const auto& source : sources) {
    for (const auto& v : source.variables()) ++counts[v.first];
  }
  std::vector<std::string> names;
  for (const auto& v : sources[0].variables()) {
    if (counts[v.first] == sources.size()) names.push_back(v.first);
  }
  for (const auto& [name, count] : counts) {
    if (count != sources.size()) {
      ABSL_LOG(WARNING) << "Variable " << name << " is present in " << count
                        << " of " << sources.size()
                        << " sources and is not merged";
    }
  }
  return names;
}

/// Returns the block position of `source` along an axis joined by
/// `strategy`.
Index BlockPosition(const AxisJoinStrategy& strategy, Index source) {
  if (BlockCount(strategy) == 1) return 0;
  const auto permutation = PermutationIndices(strategy);
  for (size_t k = 0; k < permutation.size(); ++k) {
    if (permutation[k] == source) return k;
  }
  return 0;
}

Result<Cube> MergeVariable(span<const Dataset> sources,
                           const std::string& name,
                           const MergeStrategies& strategies) {
  const Cube& first = *sources[0].FindCube(name);
  const auto axis_names = first.axis_names();
  const Index n = sources.size();

  std::vector<const AxisJoinStrategy*> joins;
  std::vector<Index> grid_shape;
  Index num_blocks = 1;
  for (const auto& axis_name : axis_names) {
    const AxisJoinStrategy& strategy = strategies.at(axis_name);
    joins.push_back(&strategy);
    grid_shape.push_back(BlockCount(strategy));
    num_blocks *= grid_shape.back();
  }
  if (num_blocks != n) {
    return MakeError(
        ErrorKind::kShapeMismatch,
        absl::StrCat("Variable ", name, " of ", n,
                     " sources cannot be arranged in a grid of shape {",
                     absl::StrJoin(grid_shape, ", "), "}"));
  }

  std::vector<ArrayHandlePtr> cells(n);
  Attributes attributes = Attributes::object();
  for (Index s = 0; s < n; ++s) {
    const Cube& cube = *sources[s].FindCube(name);
    if (cube.axis_names() != axis_names) {
      return MakeError(
          ErrorKind::kShapeMismatch,
          absl::StrCat("Variable ", name, " has axes {",
                       absl::StrJoin(cube.axis_names(), ", "),
                       "} in source ", s, " but {",
                       absl::StrJoin(axis_names, ", "), "} in source 0"));
    }
    Index cell_index = 0;
    for (size_t dim = 0; dim < joins.size(); ++dim) {
      cell_index = cell_index * grid_shape[dim] + BlockPosition(*joins[dim], s);
    }
    cells[cell_index] = cube.handle();
    attributes = MergeAttributes(std::move(attributes), cube.attributes());
  }

  std::vector<Axis> axes;
  for (const auto* join : joins) {
    CUBESTACK_ASSIGN_OR_RETURN(auto axis, WholeAxis(*join));
    axes.push_back(std::move(axis));
  }
  CUBESTACK_ASSIGN_OR_RETURN(
      auto handle, ConcatArrayHandle::Make(grid_shape, std::move(cells)));
  ABSL_LOG_IF(INFO, merge_logging)
      << "Merged variable " << name << " from grid {"
      << absl::StrJoin(grid_shape, ", ") << "}";
  return Cube::Make(std::move(axes), std::move(handle), std::move(attributes));
}

/// Concatenates `name` along its existing axis `dim`.
Result<Cube> ConcatenateExistingAxis(span<const std::optional<Dataset>> sources,
                                     const Cube& first,
                                     const std::string& name,
                                     DimensionIndex dim) {
  const Index n = sources.size();
  std::vector<ArrayHandlePtr> cells;
  std::vector<AxisValues> values;
  for (Index s = 0; s < n; ++s) {
    if (!sources[s]) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Source ", s, " is absent but variable ", name,
          " is concatenated along its axis ", first.axes()[dim].name()));
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto cube, sources[s]->GetCube(name),
                               MaybeAnnotateStatus(
                                   _, absl::StrCat("In source ", s)));
    values.push_back(cube.axes()[dim].values());
    cells.push_back(cube.handle());
  }
  std::vector<Index> order(n);
  std::iota(order.begin(), order.end(), Index{0});
  CUBESTACK_ASSIGN_OR_RETURN(auto merged_values,
                             ConcatAxisValues(values, order));
  std::vector<Index> grid_shape(first.rank(), 1);
  grid_shape[dim] = n;
  CUBESTACK_ASSIGN_OR_RETURN(
      auto handle, ConcatArrayHandle::Make(grid_shape, std::move(cells)));
  std::vector<Axis> axes = first.axes();
  axes[dim] = Axis(axes[dim].name(), std::move(merged_values));
  return Cube::Make(std::move(axes), std::move(handle), first.attributes());
}

/// Stacks `name` along a new last axis described by `join`.
Result<Cube> StackNewAxis(span<const std::optional<Dataset>> sources,
                          const Cube& first, const std::string& name,
                          const NewDim& join) {
  const Index n = sources.size();
  std::vector<ArrayHandlePtr> cells;
  for (Index s = 0; s < n; ++s) {
    if (!sources[s]) {
      cells.push_back(nullptr);
      continue;
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto cube, sources[s]->GetCube(name),
                               MaybeAnnotateStatus(
                                   _, absl::StrCat("In source ", s)));
    CUBESTACK_ASSIGN_OR_RETURN(
        auto cell, MakeNewAxisArrayHandle(cube.handle(), cube.rank()));
    cells.push_back(std::move(cell));
  }
  std::vector<Index> grid_shape(first.rank() + 1, 1);
  grid_shape.back() = BlockCount(join);
  // Absent sources occupy slabs of their own along the new axis, so the
  // block extents are given explicitly.
  std::vector<std::vector<Index>> block_extents;
  for (Index extent : first.shape()) block_extents.push_back({extent});
  block_extents.emplace_back(n, 1);
  CUBESTACK_ASSIGN_OR_RETURN(
      auto handle, ConcatArrayHandle::Make(grid_shape, std::move(cells),
                                           std::move(block_extents),
                                           first.dtype()));
  CUBESTACK_ASSIGN_OR_RETURN(auto new_axis, WholeAxis(join));
  std::vector<Axis> axes = first.axes();
  axes.push_back(std::move(new_axis));
  return Cube::Make(std::move(axes), std::move(handle), first.attributes());
}

}  // namespace

Result<Dataset> MergeDatasets(span<const Dataset> sources) {
  if (sources.empty()) {
    return absl::InvalidArgumentError("Cannot merge an empty list of datasets");
  }
  if (sources.size() == 1) return sources[0];
  CUBESTACK_ASSIGN_OR_RETURN(auto strategies, CreateMergeStrategies(sources));

  std::vector<Dataset::Variable> variables;
  for (const auto& name : SharedVariableNames(sources)) {
    CUBESTACK_ASSIGN_OR_RETURN(
        auto cube, MergeVariable(sources, name, strategies),
        MaybeAnnotateStatus(_, absl::StrCat("Merging variable ", name)));
    variables.emplace_back(name, std::move(cube));
  }
  return Dataset::Make(std::move(variables), sources[0].properties());
}

Result<Dataset> MergeAlongAxis(span<const std::optional<Dataset>> sources,
                               const Axis& merge_axis) {
  const Index n = sources.size();
  if (merge_axis.size() != n) {
    return absl::InvalidArgumentError(
        absl::StrCat("Axis ", merge_axis.name(), " has length ",
                     merge_axis.size(), " but there are ", n, " sources"));
  }
  const Dataset* first = nullptr;
  for (const auto& source : sources) {
    if (source) {
      first = &*source;
      break;
    }
  }
  if (!first) {
    return absl::InvalidArgumentError("All sources are absent");
  }
  NewDim join{merge_axis};
  if (merge_axis.lookup_kind() == LookupKind::kNone) {
    std::vector<std::int64_t> positions(n);
    std::iota(positions.begin(), positions.end(), std::int64_t{1});
    join.axis = Axis(merge_axis.name(), std::move(positions));
  }

  std::vector<Dataset::Variable> variables;
  for (const auto& [name, cube] : first->variables()) {
    const auto dim = cube.FindAxis(merge_axis.name());
    auto merged = dim ? ConcatenateExistingAxis(sources, cube, name, *dim)
                      : StackNewAxis(sources, cube, name, join);
    if (!merged.ok()) {
      return MaybeAnnotateStatus(merged.status(),
                                 absl::StrCat("Merging variable ", name));
    }
    variables.emplace_back(name, *std::move(merged));
  }
  return Dataset::Make(std::move(variables), first->properties());
}

}  // namespace cubestack
