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

#ifndef CUBESTACK_PERSIST_MEMORY_MEMORY_STORAGE_H_
#define CUBESTACK_PERSIST_MEMORY_MEMORY_STORAGE_H_

#include <memory>
#include <string>
#include <string_view>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "cubestack/cube.h"
#include "cubestack/index.h"
#include "cubestack/persist/chunk_offset.h"
#include "cubestack/persist/storage_driver.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Storage driver that keeps layouts in memory, keyed by path.
///
/// Layouts live as long as the driver or any `LayoutPtr` referring to them.
/// All operations are thread-safe.
class MemoryStorageDriver : public StorageDriver {
 public:
  bool Exists(std::string_view path) const override;

  absl::Status Delete(std::string_view path) override;

  Result<LayoutPtr> CreateLayout(
      std::string_view path, const Attributes& global_attributes,
      span<const StoredAxis> axes,
      span<const VariableDescriptor> variables) override;

  Result<LayoutPtr> AppendLayout(
      std::string_view path, span<const StoredAxis> axes,
      span<const VariableDescriptor> variables) override;

  Result<LayoutPtr> OpenLayout(std::string_view path) const override;

 private:
  class MemoryLayout;

  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, std::shared_ptr<MemoryLayout>> layouts_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace cubestack

#endif  // CUBESTACK_PERSIST_MEMORY_MEMORY_STORAGE_H_
