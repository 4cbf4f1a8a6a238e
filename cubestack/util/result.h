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

#ifndef CUBESTACK_UTIL_RESULT_H_
#define CUBESTACK_UTIL_RESULT_H_

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace cubestack {

/// `Result<T>` holds either a value of type `T` or an error `absl::Status`.
///
/// All fallible operations in cubestack return `absl::Status` (no value) or
/// `Result<T>`.
template <typename T>
using Result = absl::StatusOr<T>;

template <typename T>
inline const absl::Status& GetStatus(const Result<T>& result) {
  return result.status();
}

}  // namespace cubestack

#define CUBESTACK_INTERNAL_PP_CAT_IMPL(x, y) x##y
#define CUBESTACK_INTERNAL_PP_CAT(x, y) CUBESTACK_INTERNAL_PP_CAT_IMPL(x, y)

/// Convenience macro for propagating errors when calling a function that
/// returns a `cubestack::Result`.
///
/// This macro generates multiple statements and should be invoked as follows::
///
///     Result<int> GetSomeResult();
///
///     CUBESTACK_ASSIGN_OR_RETURN(int x, GetSomeResult());
///
#define CUBESTACK_INTERNAL_PP_EXPAND(...) __VA_ARGS__

/// Assigns the value of a `Result` to `decl`, or returns its error status.
///
/// An optional third argument is an expression returned in place of the
/// status; within it, `_` names the error status:
///
///     CUBESTACK_ASSIGN_OR_RETURN(auto x, GetX(),
///                                MaybeAnnotateStatus(_, "Reading x"));
#define CUBESTACK_ASSIGN_OR_RETURN(decl, ...)                             \
  CUBESTACK_INTERNAL_PP_EXPAND(CUBESTACK_INTERNAL_ASSIGN_OR_RETURN_IMPL(  \
      CUBESTACK_INTERNAL_PP_CAT(cubestack_assign_or_return_, __LINE__),   \
      decl, __VA_ARGS__, _))                                              \
  /**/

#define CUBESTACK_INTERNAL_ASSIGN_OR_RETURN_IMPL(temp, decl, expr,   \
                                                 error_expr, ...)    \
  auto temp = (expr);                                                \
  if (ABSL_PREDICT_FALSE(!temp.ok())) {                              \
    auto _ = std::move(temp).status();                               \
    static_cast<void>(_);                                            \
    return (error_expr);                                             \
  }                                                                  \
  decl = std::move(temp).value();

#endif  // CUBESTACK_UTIL_RESULT_H_
