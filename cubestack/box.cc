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

#include "cubestack/box.h"

#include <ostream>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/index.h"

namespace cubestack {

Index ProductOfExtents(span<const Index> shape) {
  Index product = 1;
  for (Index extent : shape) product *= extent;
  return product;
}

Index Box::num_elements() const { return ProductOfExtents(shape_); }

std::ostream& operator<<(std::ostream& os, const Box& box) {
  os << "{origin={" << absl::StrJoin(box.origin_, ", ") << "}, shape={"
     << absl::StrJoin(box.shape_, ", ") << "}}";
  return os;
}

absl::Status ValidateBoxWithinShape(const Box& box, span<const Index> shape) {
  if (box.rank() != static_cast<DimensionIndex>(shape.size())) {
    return absl::InvalidArgumentError(
        absl::StrCat("Box of rank ", box.rank(),
                     " does not match array rank ", shape.size()));
  }
  for (DimensionIndex i = 0; i < box.rank(); ++i) {
    if (box.origin(i) < 0 || box.shape(i) < 0 ||
        box.exclusive_max(i) > shape[i]) {
      return absl::OutOfRangeError(absl::StrCat(
          "Interval [", box.origin(i), ", ", box.exclusive_max(i),
          ") of dimension ", i, " is outside [0, ", shape[i], ")"));
    }
  }
  return absl::OkStatus();
}

}  // namespace cubestack
