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

#ifndef CUBESTACK_DRIVER_ARRAY_HANDLE_H_
#define CUBESTACK_DRIVER_ARRAY_HANDLE_H_

#include <memory>
#include <vector>

#include "absl/status/status.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Read-only view of an n-dimensional array whose elements are produced on
/// demand.
///
/// Handles never copy or materialize data until `Read` is called.  `Read`
/// must be free of observable side effects and repeatable: two reads of the
/// same box return equal arrays.  Implementations must support concurrent
/// calls to `Read` from multiple threads.
///
/// Handles are shared between datasets through `ArrayHandlePtr`; a dataset
/// derived from another one refers to the same handles.
class ArrayHandle {
 public:
  virtual ~ArrayHandle() = default;

  virtual DataType dtype() const = 0;

  virtual std::vector<Index> shape() const = 0;

  /// Returns the native chunking of the underlying data.
  virtual ChunkGrid chunk_grid() const = 0;

  /// Reads the region `box`, which must lie within `[0, shape())`.
  ///
  /// The returned array has shape `box.shape()` and is not aliased by the
  /// handle.
  virtual Result<SharedArray> Read(const Box& box) const = 0;

  DimensionIndex rank() const { return shape().size(); }
};

using ArrayHandlePtr = std::shared_ptr<const ArrayHandle>;

/// Array handle that additionally accepts writes.
class WritableArrayHandle : public ArrayHandle {
 public:
  /// Writes `data` so that its first element lands at `origin`.
  virtual absl::Status Write(span<const Index> origin,
                             const SharedArray& data) = 0;
};

using WritableArrayHandlePtr = std::shared_ptr<WritableArrayHandle>;

/// Reads the full extent of `handle`.
Result<SharedArray> ReadAll(const ArrayHandle& handle);

/// Returns an error if `box` does not lie within the shape of `handle`.
absl::Status ValidateReadBox(const ArrayHandle& handle, const Box& box);

}  // namespace cubestack

#endif  // CUBESTACK_DRIVER_ARRAY_HANDLE_H_
