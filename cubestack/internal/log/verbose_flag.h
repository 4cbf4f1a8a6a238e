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

#ifndef CUBESTACK_INTERNAL_LOG_VERBOSE_FLAG_H_
#define CUBESTACK_INTERNAL_LOG_VERBOSE_FLAG_H_

#include <atomic>
#include <string_view>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"

namespace cubestack {
namespace internal_log {

/// Enables the verbose flags named in the comma-separated list `names`
/// and disables all others.  The name `all` enables every flag.
///
/// The initial list is read from the `CUBESTACK_VERBOSE_LOGGING` environment
/// variable; setting the `--cubestack_verbose_logging` flag replaces it.
void SetVerboseLogging(std::string_view names);

/// Named switch for a group of verbose log messages:
///
///   ABSL_CONST_INIT internal_log::VerboseFlag merge_logging("merge");
///   ABSL_LOG_IF(INFO, merge_logging) << "Joining axis " << name;
///
/// Must have static storage duration.  Checking a flag that has already been
/// consulted once is a single relaxed atomic load.
class VerboseFlag {
 public:
  explicit constexpr VerboseFlag(const char* name) : name_(name) {}

  VerboseFlag(const VerboseFlag&) = delete;
  VerboseFlag& operator=(const VerboseFlag&) = delete;

  const char* name() const { return name_; }

  ABSL_ATTRIBUTE_ALWAYS_INLINE
  operator bool() {
    const int state = state_.load(std::memory_order_relaxed);
    if (ABSL_PREDICT_TRUE(state != kUnregistered)) return state == kEnabled;
    return Register();
  }

 private:
  enum : int { kUnregistered, kDisabled, kEnabled };

  static int StateFor(bool enabled) { return enabled ? kEnabled : kDisabled; }

  // Adds the flag to the registry and returns whether it is enabled.
  bool Register();

  std::atomic<int> state_{kUnregistered};
  const char* const name_;
  VerboseFlag* next_ = nullptr;  // Guarded by the registry mutex.

  friend void SetVerboseLogging(std::string_view names);
};

}  // namespace internal_log
}  // namespace cubestack

#endif  // CUBESTACK_INTERNAL_LOG_VERBOSE_FLAG_H_
