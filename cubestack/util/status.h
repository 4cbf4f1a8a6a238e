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

#ifndef CUBESTACK_UTIL_STATUS_H_
#define CUBESTACK_UTIL_STATUS_H_

#include <string_view>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Returns `source` with `message` prepended to its error message.
///
/// The status code and any payloads of `source` are preserved.  If `source`
/// is OK, it is returned unchanged.
absl::Status MaybeAnnotateStatus(absl::Status source,
                                 std::string_view message);

inline const absl::Status& GetStatus(const absl::Status& status) {
  return status;
}
inline absl::Status GetStatus(absl::Status&& status) {
  return std::move(status);
}

}  // namespace cubestack

/// Causes the containing function to return the specified `absl::Status`
/// value if it is an error status.
///
/// Example::
///
///     absl::Status GetSomeStatus();
///
///     absl::Status Bar() {
///       CUBESTACK_RETURN_IF_ERROR(GetSomeStatus());
///       // More code
///       return absl::OkStatus();
///     }
///
/// Returns the error status of `expr`, if any.
///
/// An optional second argument is an expression returned in place of the
/// status; within it, `_` names the error status.
#define CUBESTACK_RETURN_IF_ERROR(...) \
  CUBESTACK_INTERNAL_PP_EXPAND(        \
      CUBESTACK_INTERNAL_RETURN_IF_ERROR_IMPL(__VA_ARGS__, _))

#define CUBESTACK_INTERNAL_RETURN_IF_ERROR_IMPL(expr, error_expr, ...) \
  for (absl::Status _ = ::cubestack::GetStatus(expr);                  \
       ABSL_PREDICT_FALSE(!_.ok());)                                   \
  return error_expr /**/

#endif  // CUBESTACK_UTIL_STATUS_H_
