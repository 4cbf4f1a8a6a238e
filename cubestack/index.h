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

#ifndef CUBESTACK_INDEX_H_
#define CUBESTACK_INDEX_H_

#include <cstddef>
#include <cstdint>

#include "absl/types/span.h"

namespace cubestack {

/// Integer type used for positions, extents and offsets along an axis.
using Index = std::int64_t;

/// Integer type used to identify a dimension (axis position) of an array.
using DimensionIndex = std::ptrdiff_t;

template <typename T>
using span = absl::Span<T>;

}  // namespace cubestack

#endif  // CUBESTACK_INDEX_H_
