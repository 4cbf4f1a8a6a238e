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

#include "cubestack/internal/json/json.h"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "absl/functional/function_ref.h"
#include "absl/status/status.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include <nlohmann/json.hpp>
#include "cubestack/util/status.h"

namespace cubestack {
namespace internal_json {
namespace {

std::string QuoteString(std::string_view s) {
  return absl::StrCat("\"", absl::CHexEscape(s), "\"");
}

}  // namespace

::nlohmann::json JsonExtractMember(::nlohmann::json::object_t* j_obj,
                                   std::string_view name) {
  if (auto it = j_obj->find(std::string(name)); it != j_obj->end()) {
    auto node = j_obj->extract(it);
    return std::move(node.mapped());
  }
  return ::nlohmann::json(::nlohmann::json::value_t::discarded);
}

absl::Status JsonExtraMembersError(const ::nlohmann::json::object_t& j_obj) {
  return absl::InvalidArgumentError(absl::StrCat(
      "Object includes extra members: ",
      absl::StrJoin(j_obj, ",", [](std::string* out, const auto& p) {
        *out += QuoteString(p.first);
      })));
}

absl::Status ExpectedError(const ::nlohmann::json& j,
                           std::string_view type_name) {
  if (j.is_discarded()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Expected ", type_name, ", but member is missing"));
  }
  return absl::InvalidArgumentError(
      absl::StrCat("Expected ", type_name, ", but received: ", j.dump()));
}

absl::Status ValidationError(const ::nlohmann::json& j,
                             std::string_view type_name) {
  return absl::InvalidArgumentError(absl::StrCat(
      "Validation of ", type_name, " failed, received: ", j.dump()));
}

std::optional<double> JsonValueAsNumber(const ::nlohmann::json& j) {
  if (!j.is_number()) return std::nullopt;
  return j.get<double>();
}

std::optional<std::int64_t> JsonValueAsInteger(const ::nlohmann::json& j) {
  if (j.is_number_integer()) return j.get<std::int64_t>();
  if (j.is_number_float()) {
    const double x = j.get<double>();
    if (std::isfinite(x) && std::floor(x) == x && std::abs(x) < 9.2e18) {
      return static_cast<std::int64_t>(x);
    }
  }
  return std::nullopt;
}

absl::Status JsonParseOptionalMember(
    ::nlohmann::json::object_t* j_obj, std::string_view name,
    absl::FunctionRef<absl::Status(const ::nlohmann::json& value)> handler) {
  ::nlohmann::json value = JsonExtractMember(j_obj, name);
  if (value.is_discarded()) return absl::OkStatus();
  return MaybeAnnotateStatus(
      handler(value),
      absl::StrCat("Error parsing object member ", QuoteString(name)));
}

::nlohmann::json ParseJson(std::string_view str) {
  return ::nlohmann::json::parse(str, nullptr, false);
}

}  // namespace internal_json
}  // namespace cubestack
