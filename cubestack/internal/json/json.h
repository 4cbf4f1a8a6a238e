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

#ifndef CUBESTACK_INTERNAL_JSON_JSON_H_
#define CUBESTACK_INTERNAL_JSON_JSON_H_

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include <nlohmann/json.hpp>

namespace cubestack {
namespace internal_json {

/// Removes the member `name` from `j_obj` and returns it, or returns a
/// discarded value if it is not present.
::nlohmann::json JsonExtractMember(::nlohmann::json::object_t* j_obj,
                                   std::string_view name);

/// Returns an error listing the members remaining in `j_obj`.
absl::Status JsonExtraMembersError(const ::nlohmann::json::object_t& j_obj);

/// Returns an error indicating that `j` is not of type `type_name`.
absl::Status ExpectedError(const ::nlohmann::json& j,
                           std::string_view type_name);

/// Returns an error indicating that `j` failed validation as `type_name`.
absl::Status ValidationError(const ::nlohmann::json& j,
                             std::string_view type_name);

/// Returns the numeric value of `j`, or `std::nullopt` if `j` is not a
/// number.
std::optional<double> JsonValueAsNumber(const ::nlohmann::json& j);

/// Returns the integer value of `j`, or `std::nullopt` if `j` is not an
/// integer or a floating point number with an integer value.
std::optional<std::int64_t> JsonValueAsInteger(const ::nlohmann::json& j);

/// Extracts the member `name` from `j_obj` and, if present, passes it to
/// `handler`.  Errors are annotated with the member name.
absl::Status JsonParseOptionalMember(
    ::nlohmann::json::object_t* j_obj, std::string_view name,
    absl::FunctionRef<absl::Status(const ::nlohmann::json& value)> handler);

/// Parses `str`, returning a discarded value on syntax errors.
::nlohmann::json ParseJson(std::string_view str);

}  // namespace internal_json
}  // namespace cubestack

#endif  // CUBESTACK_INTERNAL_JSON_JSON_H_
