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

#include "cubestack/util/status_testutil.h"

#include <regex>  // NOLINT
#include <string>
#include <string_view>

namespace cubestack {
namespace internal_status {

bool MessageMatches(std::string_view message, const std::string& pattern) {
  return std::regex_match(message.begin(), message.end(),
                          std::regex(pattern));
}

}  // namespace internal_status
}  // namespace cubestack
