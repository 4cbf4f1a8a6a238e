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

#include "cubestack/config.h"

#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/status/status.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include <nlohmann/json.hpp>
#include "cubestack/internal/json/json.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

ABSL_CONST_INIT absl::Mutex config_mutex(absl::kConstInit);

Config& GlobalConfig() ABSL_EXCLUSIVE_LOCKS_REQUIRED(config_mutex) {
  static Config config;
  return config;
}

}  // namespace

Result<Config> Config::FromJson(::nlohmann::json j) {
  auto* j_obj = j.get_ptr<::nlohmann::json::object_t*>();
  if (!j_obj) return internal_json::ExpectedError(j, "object");
  Config config;
  CUBESTACK_RETURN_IF_ERROR(internal_json::JsonParseOptionalMember(
      j_obj, "working_directory", [&](const ::nlohmann::json& value) {
        const auto* s = value.get_ptr<const std::string*>();
        if (!s) return internal_json::ExpectedError(value, "string");
        config.working_directory = *s;
        return absl::OkStatus();
      }));
  CUBESTACK_RETURN_IF_ERROR(internal_json::JsonParseOptionalMember(
      j_obj, "max_cache_bytes", [&](const ::nlohmann::json& value) {
        auto x = internal_json::JsonValueAsNumber(value);
        if (!x) return internal_json::ExpectedError(value, "number");
        if (!(*x > 0)) {
          return internal_json::ValidationError(value, "positive number");
        }
        config.max_cache_bytes = *x;
        return absl::OkStatus();
      }));
  CUBESTACK_RETURN_IF_ERROR(internal_json::JsonParseOptionalMember(
      j_obj, "write_factor", [&](const ::nlohmann::json& value) {
        auto x = internal_json::JsonValueAsNumber(value);
        if (!x) return internal_json::ExpectedError(value, "number");
        if (!(*x >= 1)) {
          return internal_json::ValidationError(value, "number >= 1");
        }
        config.write_factor = *x;
        return absl::OkStatus();
      }));
  if (!j_obj->empty()) return internal_json::JsonExtraMembersError(*j_obj);
  return config;
}

::nlohmann::json Config::ToJson() const {
  return ::nlohmann::json{{"working_directory", working_directory},
                          {"max_cache_bytes", max_cache_bytes},
                          {"write_factor", write_factor}};
}

absl::Status Config::Validate() const {
  if (!(max_cache_bytes > 0)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "max_cache_bytes must be positive, but is ", max_cache_bytes));
  }
  if (!(write_factor >= 1)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "write_factor must be at least 1, but is ", write_factor));
  }
  return absl::OkStatus();
}

absl::Status InitializeConfig(Config config) {
  CUBESTACK_RETURN_IF_ERROR(config.Validate());
  absl::MutexLock lock(&config_mutex);
  GlobalConfig() = std::move(config);
  return absl::OkStatus();
}

Config GetConfig() {
  absl::MutexLock lock(&config_mutex);
  return GlobalConfig();
}

void ResetConfig() {
  absl::MutexLock lock(&config_mutex);
  GlobalConfig() = Config();
}

std::string ResolvePath(const Config& config, const std::string& path) {
  if (config.working_directory.empty() || absl::StartsWith(path, "/")) {
    return path;
  }
  if (absl::EndsWith(config.working_directory, "/")) {
    return absl::StrCat(config.working_directory, path);
  }
  return absl::StrCat(config.working_directory, "/", path);
}

}  // namespace cubestack
