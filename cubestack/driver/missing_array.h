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

#ifndef CUBESTACK_DRIVER_MISSING_ARRAY_H_
#define CUBESTACK_DRIVER_MISSING_ARRAY_H_

#include <optional>
#include <vector>

#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Returns a handle whose elements are all the missing value of `dtype`.
///
/// No data is stored; every read allocates a fresh missing-filled block.
///
/// \param chunk_grid Declared chunking; a single chunk if not specified.
/// \error `absl::StatusCode::kInvalidArgument` if `chunk_grid` does not
///     describe `shape`.
Result<ArrayHandlePtr> MakeMissingArrayHandle(
    DataType dtype, std::vector<Index> shape,
    std::optional<ChunkGrid> chunk_grid = {});

}  // namespace cubestack

#endif  // CUBESTACK_DRIVER_MISSING_ARRAY_H_
