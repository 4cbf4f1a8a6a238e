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

#ifndef CUBESTACK_CONFIG_H_
#define CUBESTACK_CONFIG_H_

#include <string>

#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "cubestack/util/result.h"

namespace cubestack {

/// Process-wide defaults for reading and persisting datasets.
///
/// JSON representation:
///
///     {"working_directory": "/data/cubes",
///      "max_cache_bytes": 5e8,
///      "write_factor": 4.0}
///
/// All members are optional.
struct Config {
  /// Directory against which relative dataset paths are resolved.
  std::string working_directory;

  /// Upper bound on the bytes buffered by a copy, and the size above which
  /// eager reads log a warning.
  double max_cache_bytes = 5e8;

  /// Multiplier relating the bytes of one copy window to the memory it
  /// requires.  Larger values give smaller windows.
  double write_factor = 4.0;

  /// Parses a configuration.  Unknown members are rejected.
  static Result<Config> FromJson(::nlohmann::json j);

  ::nlohmann::json ToJson() const;

  /// Returns an error if a member is out of range.
  absl::Status Validate() const;

  friend bool operator==(const Config& a, const Config& b) {
    return a.working_directory == b.working_directory &&
           a.max_cache_bytes == b.max_cache_bytes &&
           a.write_factor == b.write_factor;
  }
  friend bool operator!=(const Config& a, const Config& b) {
    return !(a == b);
  }
};

/// Replaces the process-wide configuration.
absl::Status InitializeConfig(Config config);

/// Returns a copy of the process-wide configuration.
Config GetConfig();

/// Restores the process-wide configuration to the defaults.
void ResetConfig();

/// Returns `path` resolved against `config.working_directory` if it is
/// relative.
std::string ResolvePath(const Config& config, const std::string& path);

}  // namespace cubestack

#endif  // CUBESTACK_CONFIG_H_
