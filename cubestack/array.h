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

#ifndef CUBESTACK_ARRAY_H_
#define CUBESTACK_ARRAY_H_

#include <cassert>
#include <cstddef>
#include <cstring>
#include <initializer_list>
#include <iosfwd>
#include <memory>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "cubestack/box.h"
#include "cubestack/data_type.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Contiguous, C-order, reference-counted n-dimensional array of elements.
///
/// Copies of a `SharedArray` share the same buffer.  Arrays returned by
/// `ArrayHandle::Read` are owned by the caller and are never aliased by the
/// handle, so callers may modify them in place.
class SharedArray {
 public:
  SharedArray() = default;

  SharedArray(DataType dtype, std::vector<Index> shape,
              std::shared_ptr<std::byte[]> data)
      : dtype_(dtype), shape_(std::move(shape)), data_(std::move(data)) {}

  bool valid() const { return static_cast<bool>(data_); }
  DataType dtype() const { return dtype_; }
  DimensionIndex rank() const { return shape_.size(); }
  span<const Index> shape() const { return shape_; }
  Index num_elements() const { return ProductOfExtents(shape_); }
  std::ptrdiff_t num_bytes() const { return num_elements() * dtype_.size(); }

  const std::byte* data() const { return data_.get(); }
  std::byte* data() { return data_.get(); }

  const std::shared_ptr<std::byte[]>& shared_data() const { return data_; }

  /// Returns the C-order linear position of `indices`.
  Index LinearIndex(span<const Index> indices) const {
    assert(indices.size() == shape_.size());
    Index linear = 0;
    for (size_t i = 0; i < indices.size(); ++i) {
      linear = linear * shape_[i] + indices[i];
    }
    return linear;
  }

  /// Returns the element at `indices`.  `T` must match `dtype()`.
  template <typename T>
  T Get(span<const Index> indices) const {
    assert(dtype_v<T> == dtype_);
    T value;
    std::memcpy(&value, data() + LinearIndex(indices) * sizeof(T), sizeof(T));
    return value;
  }
  template <typename T>
  T Get(std::initializer_list<Index> indices) const {
    return Get<T>(span<const Index>(indices.begin(), indices.size()));
  }

  template <typename T>
  void Set(span<const Index> indices, T value) {
    assert(dtype_v<T> == dtype_);
    std::memcpy(data() + LinearIndex(indices) * sizeof(T), &value, sizeof(T));
  }

  /// Returns all elements in C order.  `T` must match `dtype()`.
  template <typename T>
  std::vector<T> ToVector() const {
    assert(dtype_v<T> == dtype_);
    std::vector<T> values(num_elements());
    if (!values.empty()) {
      std::memcpy(values.data(), data(), values.size() * sizeof(T));
    }
    return values;
  }

  friend std::ostream& operator<<(std::ostream& os, const SharedArray& array);

 private:
  DataType dtype_;
  std::vector<Index> shape_;
  std::shared_ptr<std::byte[]> data_;
};

/// Allocates a zero-initialized array.
SharedArray AllocateArray(DataType dtype, span<const Index> shape);

/// Allocates an array filled with the missing-value sentinel of `dtype`.
SharedArray AllocateMissingArray(DataType dtype, span<const Index> shape);

/// Creates an array of the given shape from C-order `values`.
template <typename T>
SharedArray MakeArray(span<const Index> shape, const std::vector<T>& values) {
  SharedArray array = AllocateArray(dtype_v<T>, shape);
  assert(static_cast<Index>(values.size()) == array.num_elements());
  if (!values.empty()) {
    std::memcpy(array.data(), values.data(), values.size() * sizeof(T));
  }
  return array;
}

/// Creates a rank-1 array.
template <typename T>
SharedArray MakeArray(const std::vector<T>& values) {
  const Index shape[] = {static_cast<Index>(values.size())};
  return MakeArray<T>(shape, values);
}

/// Copies the region `source_box` of `source` into `dest`, placing its first
/// element at `dest_origin`.
///
/// \error `absl::StatusCode::kInvalidArgument` if the data types or ranks
///     differ.
/// \error `absl::StatusCode::kOutOfRange` if a region lies outside an array.
absl::Status CopyArrayRegion(const SharedArray& source, const Box& source_box,
                             SharedArray& dest, span<const Index> dest_origin);

/// Returns a newly allocated copy of the region `box` of `source`.
Result<SharedArray> SubArray(const SharedArray& source, const Box& box);

/// Returns `true` if `a` and `b` have the same data type, shape and bytes.
bool ArraysEqual(const SharedArray& a, const SharedArray& b);

}  // namespace cubestack

#endif  // CUBESTACK_ARRAY_H_
