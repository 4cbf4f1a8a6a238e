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

#include "cubestack/merge/axis_join.h"

#include <algorithm>
#include <numeric>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "cubestack/axis.h"
#include "cubestack/dataset.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/internal/log/verbose_flag.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag merge_logging("merge");

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

/// Returns `true` if all values of `a` lie before all values of `b`.  An
/// empty sequence precedes any non-empty one.
template <typename T>
bool Precedes(const std::vector<T>& a, const std::vector<T>& b) {
  if (a.empty()) return !b.empty();
  if (b.empty()) return false;
  return *std::max_element(a.begin(), a.end()) <
         *std::min_element(b.begin(), b.end());
}

bool Precedes(const AxisValues& a, const AxisValues& b) {
  return std::visit(
      [&](const auto& a_values) {
        using Vector = std::decay_t<decltype(a_values)>;
        return Precedes(a_values, std::get<Vector>(b));
      },
      a);
}

Result<AxisJoinStrategy> AnalyzeRanges(std::string_view axis_name,
                                       span<const Axis> axes) {
  const size_t n = axes.size();
  bool ascending = true;
  bool descending = true;
  for (const auto& axis : axes) {
    ascending = ascending && IsNonDecreasing(axis.values());
    descending = descending && IsNonIncreasing(axis.values());
  }
  if (!ascending && !descending) {
    return MakeError(ErrorKind::kInconsistentOrdering,
                     absl::StrCat("Values of axis ", axis_name,
                                  " are neither all non-decreasing nor all "
                                  "non-increasing"));
  }
  for (size_t i = 0; i < n; ++i) {
    for (size_t j = i + 1; j < n; ++j) {
      const auto& a = axes[i].values();
      const auto& b = axes[j].values();
      if (AxisValuesSize(a) == 0 || AxisValuesSize(b) == 0) continue;
      if (!Precedes(a, b) && !Precedes(b, a)) {
        return MakeError(ErrorKind::kOverlappingRanges,
                         absl::StrCat("Values of axis ", axis_name,
                                      " overlap between sources ", i, " and ",
                                      j));
      }
    }
  }
  SortedRanges ranges;
  ranges.axes.assign(axes.begin(), axes.end());
  ranges.permutation.resize(n);
  std::iota(ranges.permutation.begin(), ranges.permutation.end(), Index{0});
  std::stable_sort(ranges.permutation.begin(), ranges.permutation.end(),
                   [&](Index a, Index b) {
                     const auto& a_values = axes[a].values();
                     const auto& b_values = axes[b].values();
                     return ascending ? Precedes(a_values, b_values)
                                      : Precedes(b_values, a_values);
                   });
  return AxisJoinStrategy(std::move(ranges));
}

}  // namespace

Result<AxisJoinStrategy> AnalyzeAxisJoin(std::string_view axis_name,
                                         span<const Axis> axes) {
  if (axes.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("No values to join for axis ", axis_name));
  }
  const Axis& first = axes[0];
  for (size_t i = 1; i < axes.size(); ++i) {
    if (axes[i].is_continuous() != first.is_continuous()) {
      return MakeError(
          ErrorKind::kInconsistentAxisKind,
          absl::StrCat("Axis ", axis_name,
                       " is continuous in some sources and categorical in "
                       "others"));
    }
    if (axes[i].values().index() != first.values().index()) {
      return MakeError(ErrorKind::kInconsistentAxisKind,
                       absl::StrCat("Axis ", axis_name, " has ",
                                    AxisValuesTypeName(first.values()),
                                    " values in source 0 but ",
                                    AxisValuesTypeName(axes[i].values()),
                                    " values in source ", i));
    }
  }
  const bool all_equal =
      std::all_of(axes.begin() + 1, axes.end(), [&](const Axis& axis) {
        return axis.values() == first.values();
      });
  if (all_equal) {
    ABSL_LOG_IF(INFO, merge_logging)
        << "Axis " << axis_name << " is equal in all " << axes.size()
        << " sources";
    return AxisJoinStrategy(AllEqual{first});
  }
  if (!first.is_continuous()) {
    return MakeError(ErrorKind::kUnsupportedCategoricalJoin,
                     absl::StrCat("Categorical axis ", axis_name,
                                  " differs between sources"));
  }
  CUBESTACK_ASSIGN_OR_RETURN(auto strategy, AnalyzeRanges(axis_name, axes));
  ABSL_LOG_IF(INFO, merge_logging) << "Axis " << axis_name << ": " << strategy;
  return strategy;
}

Index BlockCount(const AxisJoinStrategy& strategy) {
  return std::visit(
      Overloaded{
          [](const AllEqual&) -> Index { return 1; },
          [](const SortedRanges& s) -> Index { return s.axes.size(); },
          [](const NewDim& s) -> Index { return s.axis.size(); },
      },
      strategy);
}

std::vector<Index> PermutationIndices(const AxisJoinStrategy& strategy) {
  if (const auto* ranges = std::get_if<SortedRanges>(&strategy)) {
    return ranges->permutation;
  }
  std::vector<Index> identity(BlockCount(strategy));
  std::iota(identity.begin(), identity.end(), Index{0});
  return identity;
}

Result<Axis> WholeAxis(const AxisJoinStrategy& strategy) {
  return std::visit(
      Overloaded{
          [](const AllEqual& s) -> Result<Axis> { return s.axis; },
          [](const NewDim& s) -> Result<Axis> { return s.axis; },
          [](const SortedRanges& s) -> Result<Axis> {
            std::vector<AxisValues> parts;
            parts.reserve(s.axes.size());
            for (const auto& axis : s.axes) parts.push_back(axis.values());
            const std::string& name = s.axes.front().name();
            CUBESTACK_ASSIGN_OR_RETURN(
                auto values, ConcatAxisValues(parts, s.permutation),
                MaybeAnnotateStatus(_, absl::StrCat("Joining axis ", name)));
            return Axis(name, std::move(values));
          },
      },
      strategy);
}

std::ostream& operator<<(std::ostream& os, const AxisJoinStrategy& strategy) {
  std::visit(
      Overloaded{
          [&](const AllEqual& s) { os << "AllEqual(" << s.axis << ")"; },
          [&](const SortedRanges& s) {
            os << "SortedRanges(" << s.axes.size() << " sources, order";
            for (Index i : s.permutation) os << " " << i;
            os << ")";
          },
          [&](const NewDim& s) { os << "NewDim(" << s.axis << ")"; },
      },
      strategy);
  return os;
}

Result<MergeStrategies> CreateMergeStrategies(span<const Dataset> datasets) {
  absl::btree_map<std::string, std::vector<Axis>> axes_by_name;
  for (const auto& dataset : datasets) {
    for (const auto& [name, axis] : dataset.axes()) {
      axes_by_name[name].push_back(axis);
    }
  }
  MergeStrategies strategies;
  for (auto& [name, axes] : axes_by_name) {
    if (axes.size() != datasets.size()) {
      return MakeError(ErrorKind::kShapeMismatch,
                       absl::StrCat("Axis ", name, " is present in ",
                                    axes.size(), " of ", datasets.size(),
                                    " sources"));
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto strategy, AnalyzeAxisJoin(name, axes));
    strategies.emplace(name, std::move(strategy));
  }
  return strategies;
}

}  // namespace cubestack
