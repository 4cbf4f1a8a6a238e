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

#ifndef CUBESTACK_ERRORS_H_
#define CUBESTACK_ERRORS_H_

#include <optional>
#include <ostream>
#include <string_view>

#include "absl/status/status.h"

namespace cubestack {

/// Classifies the metadata inconsistencies detected while merging or
/// persisting datasets.
///
/// The kind travels with the `absl::Status` as a payload, so it survives
/// `MaybeAnnotateStatus` and can be recovered with `GetErrorKind`.
enum class ErrorKind {
  /// Sources disagree on whether an axis is continuous or categorical.
  kInconsistentAxisKind,
  /// Continuous axis values are not all ascending or all descending.
  kInconsistentOrdering,
  /// Continuous axis values of two sources overlap.
  kOverlappingRanges,
  /// Categorical axis values differ between sources.
  kUnsupportedCategoricalJoin,
  /// The merged block grid does not match the sources or the shapes of the
  /// sources are incompatible.
  kShapeMismatch,
  /// Two variables sharing an axis declare different chunk offsets.
  kChunkOffsetConflict,
  /// An appended axis does not match the length already written.
  kSizeMismatch,
  /// An appended variable already exists in the layout.
  kVariableExists,
};

/// Payload type URL under which the error kind is stored.
constexpr std::string_view kErrorKindPayloadUrl = "cubestack.dev/error_kind";

std::string_view ErrorKindName(ErrorKind kind);

std::ostream& operator<<(std::ostream& os, ErrorKind kind);

/// Returns an error status carrying `kind`.
///
/// Axis join failures and shape mismatches use
/// `absl::StatusCode::kInvalidArgument`; pre-write validation failures use
/// `absl::StatusCode::kFailedPrecondition`.
absl::Status MakeError(ErrorKind kind, std::string_view message);

/// Returns the error kind attached by `MakeError`, if any.
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

}  // namespace cubestack

#endif  // CUBESTACK_ERRORS_H_
