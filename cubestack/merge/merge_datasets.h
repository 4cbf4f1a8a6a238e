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

#ifndef CUBESTACK_MERGE_MERGE_DATASETS_H_
#define CUBESTACK_MERGE_MERGE_DATASETS_H_

#include <optional>

#include "cubestack/axis.h"
#include "cubestack/dataset.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Merges datasets that tile a larger dataset into one lazy dataset.
///
/// The layout of the sources is inferred from their axis values alone (see
/// `AnalyzeAxisJoin`): every variable present in all sources becomes one
/// cube backed by a `ConcatArrayHandle` over the sources' handles, with
/// blocks ordered by axis values.  Variables missing from some source are
/// dropped with a warning.  Attributes of each variable are merged from left
/// to right; the properties of the first source are kept.
///
/// A single source is returned unchanged.  No data is read.
///
/// \error `absl::StatusCode::kInvalidArgument` if `sources` is empty.
/// \error `ErrorKind::kShapeMismatch` if the sources of a variable do not
///     form a rectangular grid, or order its axes differently.
/// \error Any error of `CreateMergeStrategies`.
Result<Dataset> MergeDatasets(span<const Dataset> sources);

/// Concatenates datasets along `merge_axis`, one source per position.
///
/// Each variable of the first present source that has an axis named like
/// `merge_axis` is concatenated along it, and the axis values are the
/// sources' values in order.  Other variables are stacked along a new last
/// axis `merge_axis`; if `merge_axis` has no coordinate values the new axis
/// is numbered from 1.  Absent sources contribute missing-filled blocks to
/// stacked variables.
///
/// \error `absl::StatusCode::kInvalidArgument` if `merge_axis` does not have
///     one position per source, if all sources are absent, or if a source
///     is absent where an existing axis is concatenated.
/// \error `absl::StatusCode::kNotFound` if a source lacks a variable of the
///     first present source.
Result<Dataset> MergeAlongAxis(span<const std::optional<Dataset>> sources,
                               const Axis& merge_axis);

}  // namespace cubestack

#endif  // CUBESTACK_MERGE_MERGE_DATASETS_H_
