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

#ifndef CUBESTACK_DRIVER_MEMORY_MEMORY_ARRAY_H_
#define CUBESTACK_DRIVER_MEMORY_MEMORY_ARRAY_H_

#include <memory>
#include <optional>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/synchronization/mutex.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Array handle backed by an in-memory `SharedArray`.
///
/// The handle owns a private copy of the data passed to `Make`, so later
/// modifications of the caller's array are not visible through the handle.
/// Reads and writes may be issued concurrently.
class MemoryArrayHandle : public WritableArrayHandle {
 public:
  /// Returns a handle holding a copy of `array`.
  ///
  /// \param chunk_grid Declared chunking; defaults to a single chunk.
  /// \error `absl::StatusCode::kInvalidArgument` if `chunk_grid` does not
  ///     describe the shape of `array`.
  static Result<std::shared_ptr<MemoryArrayHandle>> Make(
      const SharedArray& array, std::optional<ChunkGrid> chunk_grid = {});

  /// Returns a handle of the given shape filled with the missing value of
  /// `dtype`.
  static Result<std::shared_ptr<MemoryArrayHandle>> Allocate(
      DataType dtype, span<const Index> shape,
      std::optional<ChunkGrid> chunk_grid = {});

  DataType dtype() const override { return dtype_; }
  std::vector<Index> shape() const override { return shape_; }
  ChunkGrid chunk_grid() const override { return chunk_grid_; }

  Result<SharedArray> Read(const Box& box) const override;

  absl::Status Write(span<const Index> origin,
                     const SharedArray& data) override;

  /// Number of successful `Read` calls, for tests that check laziness.
  Index read_count() const;

  /// Number of successful `Write` calls.
  Index write_count() const;

 private:
  MemoryArrayHandle(SharedArray data, ChunkGrid chunk_grid);

  const DataType dtype_;
  const std::vector<Index> shape_;
  const ChunkGrid chunk_grid_;
  mutable absl::Mutex mutex_;
  SharedArray data_ ABSL_GUARDED_BY(mutex_);
  mutable Index read_count_ ABSL_GUARDED_BY(mutex_) = 0;
  Index write_count_ ABSL_GUARDED_BY(mutex_) = 0;
};

}  // namespace cubestack

#endif  // CUBESTACK_DRIVER_MEMORY_MEMORY_ARRAY_H_
