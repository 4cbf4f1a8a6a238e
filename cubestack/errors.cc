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

#include "cubestack/errors.h"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/status/status.h"
#include "absl/strings/cord.h"

namespace cubestack {
namespace {

constexpr ErrorKind kAllErrorKinds[] = {
    ErrorKind::kInconsistentAxisKind,  ErrorKind::kInconsistentOrdering,
    ErrorKind::kOverlappingRanges,     ErrorKind::kUnsupportedCategoricalJoin,
    ErrorKind::kShapeMismatch,         ErrorKind::kChunkOffsetConflict,
    ErrorKind::kSizeMismatch,          ErrorKind::kVariableExists,
};

absl::StatusCode GetStatusCode(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kChunkOffsetConflict:
    case ErrorKind::kSizeMismatch:
    case ErrorKind::kVariableExists:
      return absl::StatusCode::kFailedPrecondition;
    default:
      return absl::StatusCode::kInvalidArgument;
  }
}

}  // namespace

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInconsistentAxisKind:
      return "InconsistentAxisKind";
    case ErrorKind::kInconsistentOrdering:
      return "InconsistentOrdering";
    case ErrorKind::kOverlappingRanges:
      return "OverlappingRanges";
    case ErrorKind::kUnsupportedCategoricalJoin:
      return "UnsupportedCategoricalJoin";
    case ErrorKind::kShapeMismatch:
      return "ShapeMismatch";
    case ErrorKind::kChunkOffsetConflict:
      return "ChunkOffsetConflict";
    case ErrorKind::kSizeMismatch:
      return "SizeMismatch";
    case ErrorKind::kVariableExists:
      return "VariableExists";
  }
  return "Unknown";
}

std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  return os << ErrorKindName(kind);
}

absl::Status MakeError(ErrorKind kind, std::string_view message) {
  absl::Status status(GetStatusCode(kind), message);
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  if (status.ok()) return std::nullopt;
  auto payload = status.GetPayload(kErrorKindPayloadUrl);
  if (!payload) return std::nullopt;
  const std::string name(*payload);
  for (ErrorKind kind : kAllErrorKinds) {
    if (ErrorKindName(kind) == name) return kind;
  }
  return std::nullopt;
}

}  // namespace cubestack
