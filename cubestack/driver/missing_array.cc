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

#include "cubestack/driver/missing_array.h"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

class MissingArrayHandle : public ArrayHandle {
 public:
  MissingArrayHandle(DataType dtype, std::vector<Index> shape,
                     ChunkGrid chunk_grid)
      : dtype_(dtype),
        shape_(std::move(shape)),
        chunk_grid_(std::move(chunk_grid)) {}

  DataType dtype() const override { return dtype_; }
  std::vector<Index> shape() const override { return shape_; }
  ChunkGrid chunk_grid() const override { return chunk_grid_; }

  Result<SharedArray> Read(const Box& box) const override {
    CUBESTACK_RETURN_IF_ERROR(ValidateReadBox(*this, box));
    return AllocateMissingArray(dtype_, box.shape());
  }

 private:
  DataType dtype_;
  std::vector<Index> shape_;
  ChunkGrid chunk_grid_;
};

}  // namespace

Result<ArrayHandlePtr> MakeMissingArrayHandle(
    DataType dtype, std::vector<Index> shape,
    std::optional<ChunkGrid> chunk_grid) {
  if (!dtype.valid()) {
    return absl::InvalidArgumentError("Data type must be specified");
  }
  if (chunk_grid) {
    if (chunk_grid->shape() != shape) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Chunk grid of shape {", absl::StrJoin(chunk_grid->shape(), ", "),
          "} does not match shape {",
          absl::StrJoin(shape, ", "), "}"));
    }
  } else {
    chunk_grid = ChunkGrid::SingleChunk(shape);
  }
  return std::make_shared<MissingArrayHandle>(dtype, std::move(shape),
                                              *std::move(chunk_grid));
}

}  // namespace cubestack
