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

#include "cubestack/internal/log/verbose_flag.h"

#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"

ABSL_FLAG(std::string, cubestack_verbose_logging, "",
          "Comma-separated names of cubestack verbose logging flags to "
          "enable, or \"all\"")
    .OnUpdate([] {
      cubestack::internal_log::SetVerboseLogging(
          absl::GetFlag(FLAGS_cubestack_verbose_logging));
    });

namespace cubestack {
namespace internal_log {
namespace {

struct EnabledFlags {
  bool all = false;
  absl::flat_hash_set<std::string> names;

  bool Contains(std::string_view name) const {
    return all || names.contains(name);
  }
};

EnabledFlags ParseEnabledFlags(std::string_view input) {
  EnabledFlags enabled;
  for (std::string_view name : absl::StrSplit(input, ',', absl::SkipEmpty())) {
    name = absl::StripAsciiWhitespace(name);
    if (name.empty()) continue;
    if (name == "all") {
      enabled.all = true;
    } else {
      enabled.names.emplace(name);
    }
  }
  return enabled;
}

ABSL_CONST_INIT absl::Mutex registry_mutex(absl::kConstInit);

// Singly-linked list of every flag consulted so far.
ABSL_CONST_INIT VerboseFlag* registered_flags
    ABSL_GUARDED_BY(registry_mutex) = nullptr;

EnabledFlags& CurrentFlags() ABSL_EXCLUSIVE_LOCKS_REQUIRED(registry_mutex) {
  static EnabledFlags enabled = [] {
    const char* env = std::getenv("CUBESTACK_VERBOSE_LOGGING");
    return env ? ParseEnabledFlags(env) : EnabledFlags{};
  }();
  return enabled;
}

}  // namespace

void SetVerboseLogging(std::string_view names) {
  ABSL_LOG(INFO) << "Cubestack verbose logging enabled for \"" << names
                 << "\"";
  EnabledFlags enabled = ParseEnabledFlags(names);
  absl::MutexLock lock(&registry_mutex);
  CurrentFlags() = std::move(enabled);
  for (VerboseFlag* flag = registered_flags; flag != nullptr;
       flag = flag->next_) {
    flag->state_.store(
        VerboseFlag::StateFor(CurrentFlags().Contains(flag->name_)),
        std::memory_order_relaxed);
  }
}

bool VerboseFlag::Register() {
  absl::MutexLock lock(&registry_mutex);
  if (state_.load(std::memory_order_relaxed) == kUnregistered) {
    state_.store(StateFor(CurrentFlags().Contains(name_)),
                 std::memory_order_relaxed);
    next_ = std::exchange(registered_flags, this);
  }
  return state_.load(std::memory_order_relaxed) == kEnabled;
}

}  // namespace internal_log
}  // namespace cubestack
