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

#include "cubestack/driver/array_handle.h"

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {

absl::Status ValidateReadBox(const ArrayHandle& handle, const Box& box) {
  return MaybeAnnotateStatus(
      ValidateBoxWithinShape(box, handle.shape()),
      absl::StrCat("Cannot read ", handle.dtype().name(), " array"));
}

Result<SharedArray> ReadAll(const ArrayHandle& handle) {
  return handle.Read(Box(handle.shape()));
}

}  // namespace cubestack
