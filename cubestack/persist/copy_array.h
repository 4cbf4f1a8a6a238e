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

#ifndef CUBESTACK_PERSIST_COPY_ARRAY_H_
#define CUBESTACK_PERSIST_COPY_ARRAY_H_

#include <vector>

#include "absl/status/status.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"

namespace cubestack {

struct CopyOptions {
  /// Upper bound on the memory used by one copy step, in bytes.
  double max_buffer_bytes = 5e8;

  /// Ratio between the memory used by a copy step and the bytes of data it
  /// transfers.
  double write_factor = 4.0;
};

/// Returns the number of destination chunks along each dimension of `grid`
/// covered by one copy window.
///
/// Windows always consist of whole chunks.  Starting from a single chunk,
/// the window is grown along the innermost dimension first; a dimension is
/// grown only once all inner dimensions span the whole array.
std::vector<Index> GetCopyWindow(const ChunkGrid& grid, DataType dtype,
                                 const CopyOptions& options);

/// Copies all elements of `source` into `dest`, window by window.
///
/// Windows are aligned to the chunk grid of `dest`, so that every chunk of
/// `dest` is written exactly once.
///
/// \error `absl::StatusCode::kInvalidArgument` if the data types or shapes of
///     `source` and `dest` differ.
absl::Status CopyArray(const ArrayHandle& source, WritableArrayHandle& dest,
                       const CopyOptions& options = {});

}  // namespace cubestack

#endif  // CUBESTACK_PERSIST_COPY_ARRAY_H_
