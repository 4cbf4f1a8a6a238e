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

#ifndef CUBESTACK_MERGE_AXIS_JOIN_H_
#define CUBESTACK_MERGE_AXIS_JOIN_H_

#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/container/btree_map.h"
#include "cubestack/axis.h"
#include "cubestack/dataset.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Every source has the same values along the axis.
struct AllEqual {
  Axis axis;
};

/// Every source covers a disjoint range of the axis.
///
/// `permutation[k]` is the index of the source whose range comes `k`-th in
/// the merged axis.
struct SortedRanges {
  std::vector<Axis> axes;
  std::vector<Index> permutation;
};

/// Sources are stacked along a new axis, one position per source.
struct NewDim {
  Axis axis;
};

/// How the values of one axis are combined when merging sources.
using AxisJoinStrategy = std::variant<AllEqual, SortedRanges, NewDim>;

/// Per-axis-name strategies of a merge.
using MergeStrategies = absl::btree_map<std::string, AxisJoinStrategy>;

/// Determines how the sources' copies of the axis `axis_name` are joined.
///
/// \param axes One axis per source, in source order.
/// \error `absl::StatusCode::kInvalidArgument` if `axes` is empty.
/// \error `ErrorKind::kInconsistentAxisKind` if the axis is continuous in some
///     sources and categorical in others, or the value types differ.
/// \error `ErrorKind::kInconsistentOrdering` if the values are not all
///     non-decreasing or all non-increasing.
/// \error `ErrorKind::kOverlappingRanges` if the value ranges of two sources
///     overlap.
/// \error `ErrorKind::kUnsupportedCategoricalJoin` if categorical values
///     differ between sources.
Result<AxisJoinStrategy> AnalyzeAxisJoin(std::string_view axis_name,
                                         span<const Axis> axes);

/// Returns the number of grid blocks along the axis.
Index BlockCount(const AxisJoinStrategy& strategy);

/// Returns the order in which sources are laid out along the axis.
std::vector<Index> PermutationIndices(const AxisJoinStrategy& strategy);

/// Returns the merged axis.
Result<Axis> WholeAxis(const AxisJoinStrategy& strategy);

std::ostream& operator<<(std::ostream& os, const AxisJoinStrategy& strategy);

/// Runs `AnalyzeAxisJoin` for every axis name appearing in `datasets`.
///
/// \error `ErrorKind::kShapeMismatch` if an axis is missing from a dataset.
Result<MergeStrategies> CreateMergeStrategies(span<const Dataset> datasets);

}  // namespace cubestack

#endif  // CUBESTACK_MERGE_AXIS_JOIN_H_
