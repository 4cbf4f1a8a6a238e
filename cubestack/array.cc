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

#include "cubestack/array.h"

#include <cstddef>
#include <cstring>
#include <memory>
#include <ostream>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/box.h"
#include "cubestack/data_type.h"
#include "cubestack/index.h"
#include "cubestack/util/status.h"

namespace cubestack {

SharedArray AllocateArray(DataType dtype, span<const Index> shape) {
  const size_t num_bytes = ProductOfExtents(shape) * dtype.size();
  // Always allocate at least one byte so that `valid()` holds for empty
  // arrays.
  std::shared_ptr<std::byte[]> data(new std::byte[num_bytes ? num_bytes : 1]());
  return SharedArray(dtype, std::vector<Index>(shape.begin(), shape.end()),
                     std::move(data));
}

SharedArray AllocateMissingArray(DataType dtype, span<const Index> shape) {
  SharedArray array = AllocateArray(dtype, shape);
  dtype.FillMissing(array.data(), array.num_elements());
  return array;
}

absl::Status CopyArrayRegion(const SharedArray& source, const Box& source_box,
                             SharedArray& dest, span<const Index> dest_origin) {
  if (source.dtype() != dest.dtype()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot copy ", source.dtype().name(), " array into ",
                     dest.dtype().name(), " array"));
  }
  CUBESTACK_RETURN_IF_ERROR(ValidateBoxWithinShape(source_box, source.shape()));
  CUBESTACK_RETURN_IF_ERROR(ValidateBoxWithinShape(
      Box(std::vector<Index>(dest_origin.begin(), dest_origin.end()),
          std::vector<Index>(source_box.shape().begin(),
                             source_box.shape().end())),
      dest.shape()));
  if (source_box.is_empty()) return absl::OkStatus();

  const DimensionIndex rank = source_box.rank();
  const std::ptrdiff_t element_size = source.dtype().size();
  if (rank == 0) {
    std::memcpy(dest.data(), source.data(), element_size);
    return absl::OkStatus();
  }

  // Copy one contiguous row (innermost dimension) at a time.
  const std::ptrdiff_t row_bytes = source_box.shape(rank - 1) * element_size;
  std::vector<Index> position(rank, 0);
  std::vector<Index> source_index(rank);
  std::vector<Index> dest_index(rank);
  while (true) {
    for (DimensionIndex i = 0; i < rank; ++i) {
      source_index[i] = source_box.origin(i) + position[i];
      dest_index[i] = dest_origin[i] + position[i];
    }
    std::memcpy(dest.data() + dest.LinearIndex(dest_index) * element_size,
                source.data() + source.LinearIndex(source_index) * element_size,
                row_bytes);
    DimensionIndex dim = rank - 2;
    for (; dim >= 0; --dim) {
      if (++position[dim] < source_box.shape(dim)) break;
      position[dim] = 0;
    }
    if (dim < 0) break;
  }
  return absl::OkStatus();
}

Result<SharedArray> SubArray(const SharedArray& source, const Box& box) {
  SharedArray dest = AllocateArray(source.dtype(), box.shape());
  std::vector<Index> zero(box.rank(), 0);
  CUBESTACK_RETURN_IF_ERROR(CopyArrayRegion(source, box, dest, zero));
  return dest;
}

bool ArraysEqual(const SharedArray& a, const SharedArray& b) {
  if (a.dtype() != b.dtype() || a.shape() != b.shape()) return false;
  if (a.num_bytes() == 0) return true;
  return std::memcmp(a.data(), b.data(), a.num_bytes()) == 0;
}

std::ostream& operator<<(std::ostream& os, const SharedArray& array) {
  os << "SharedArray{dtype=" << array.dtype() << ", shape={"
     << absl::StrJoin(array.shape(), ", ") << "}}";
  return os;
}

}  // namespace cubestack
