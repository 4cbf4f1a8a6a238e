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

#ifndef CUBESTACK_UTIL_STATUS_TESTUTIL_H_
#define CUBESTACK_UTIL_STATUS_TESTUTIL_H_

/// \file
/// GMock matchers for `absl::Status` and `Result`:
///
///   EXPECT_THAT(OpenDataset(driver, "a"), ::cubestack::IsOk());
///   EXPECT_THAT(dataset.GetAxis("time"), ::cubestack::IsOkAndHolds(time));
///   EXPECT_THAT(Save(...), ::cubestack::MatchesStatus(
///                              absl::StatusCode::kAlreadyExists, "Path .*"));
///   EXPECT_THAT(Merge(...),
///               ::cubestack::HasErrorKind(ErrorKind::kOverlappingRanges));

#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <gmock/gmock.h>
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "cubestack/errors.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {

template <typename T>
void PrintTo(const Result<T>& result, std::ostream* os) {
  if (!result.ok()) {
    *os << result.status();
    return;
  }
  *os << "Result{" << ::testing::PrintToString(*result) << "}";
}

namespace internal_status {

/// Returns `true` if all of `message` matches the ECMAScript regular
/// expression `pattern`.
bool MessageMatches(std::string_view message, const std::string& pattern);

}  // namespace internal_status

MATCHER(IsOk, negation ? "is not OK" : "is OK") {
  const absl::Status& status = ::cubestack::GetStatus(arg);
  if (!status.ok()) *result_listener << "whose status is " << status;
  return status.ok();
}

MATCHER_P(IsOkAndHolds, value_matcher,
          negation ? "is not OK or holds a value that does not match"
                   : "is OK and holds a matching value") {
  if (!arg.ok()) {
    *result_listener << "whose status is " << arg.status();
    return false;
  }
  return ::testing::ExplainMatchResult(value_matcher, *arg, result_listener);
}

/// Matches any status or result with code `code`.
MATCHER_P(MatchesStatus, code,
          absl::StrCat(negation ? "does not have" : "has", " status code ",
                       absl::StatusCodeToString(code))) {
  const absl::Status& status = ::cubestack::GetStatus(arg);
  if (status.code() == code) return true;
  *result_listener << "whose status is " << status;
  return false;
}

/// Matches a status or result with code `code` whose whole message matches
/// the regular expression `pattern`.
MATCHER_P2(MatchesStatus, code, pattern,
           absl::StrCat(negation ? "does not have" : "has", " status code ",
                        absl::StatusCodeToString(code),
                        " with a message matching \"", std::string(pattern),
                        "\"")) {
  const absl::Status& status = ::cubestack::GetStatus(arg);
  if (status.code() == code &&
      internal_status::MessageMatches(status.message(), std::string(pattern))) {
    return true;
  }
  *result_listener << "whose status is " << status;
  return false;
}

/// Matches a status or result tagged with `kind` by `MakeError`.
MATCHER_P(HasErrorKind, kind,
          absl::StrCat(negation ? "does not have" : "has", " error kind ",
                       ::testing::PrintToString(kind))) {
  const absl::Status& status = ::cubestack::GetStatus(arg);
  if (::cubestack::GetErrorKind(status) == kind) return true;
  *result_listener << "whose status is " << status;
  return false;
}

}  // namespace cubestack

#define CUBESTACK_EXPECT_OK(expr) EXPECT_THAT(expr, ::cubestack::IsOk())

#define CUBESTACK_ASSERT_OK(expr) ASSERT_THAT(expr, ::cubestack::IsOk())

/// Asserts that the `Result` `expr` holds a value and moves it into `decl`.
#define CUBESTACK_ASSERT_OK_AND_ASSIGN(decl, expr)                           \
  CUBESTACK_INTERNAL_ASSERT_OK_AND_ASSIGN_IMPL(                              \
      CUBESTACK_INTERNAL_PP_CAT(cubestack_assert_ok_, __LINE__), decl, expr) \
  /**/

#define CUBESTACK_INTERNAL_ASSERT_OK_AND_ASSIGN_IMPL(temp, decl, expr) \
  auto temp = (expr);                                                  \
  ASSERT_TRUE(temp.ok()) << #expr << ": " << temp.status();            \
  decl = std::move(temp).value();

#endif  // CUBESTACK_UTIL_STATUS_TESTUTIL_H_
