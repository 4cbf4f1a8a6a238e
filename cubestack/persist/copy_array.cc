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

#include "cubestack/persist/copy_array.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/internal/log/verbose_flag.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag persist_logging("persist");

std::string CopyRegionMessage(span<const Index> origin) {
  return absl::StrCat("Copying region at {", absl::StrJoin(origin, ", "), "}");
}

}  // namespace

std::vector<Index> GetCopyWindow(const ChunkGrid& grid, DataType dtype,
                                 const CopyOptions& options) {
  const DimensionIndex rank = grid.rank();
  const auto shape = grid.shape();
  std::vector<Index> window(rank, 1);
  const double max_elements =
      options.max_buffer_bytes / (options.write_factor * dtype.size());
  auto window_extent = [&](DimensionIndex d) {
    return std::min(shape[d], grid.approx_chunk_size(d) * window[d]);
  };
  for (DimensionIndex d = rank - 1; d >= 0; --d) {
    const Index num_chunks = grid.num_chunks(d);
    if (num_chunks <= 1) continue;
    double others = 1;
    for (DimensionIndex e = 0; e < rank; ++e) {
      if (e != d) others *= window_extent(e);
    }
    const double count =
        std::floor(max_elements / (others * grid.approx_chunk_size(d)));
    if (count >= num_chunks) {
      window[d] = num_chunks;
      continue;
    }
    window[d] = std::max<Index>(1, static_cast<Index>(count));
    break;
  }
  return window;
}

absl::Status CopyArray(const ArrayHandle& source, WritableArrayHandle& dest,
                       const CopyOptions& options) {
  if (source.dtype() != dest.dtype()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Cannot copy ", source.dtype().name(), " array to ",
                     dest.dtype().name(), " array"));
  }
  const auto shape = dest.shape();
  if (source.shape() != shape) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Cannot copy array of shape {", absl::StrJoin(source.shape(), ", "),
        "} to array of shape {", absl::StrJoin(shape, ", "), "}"));
  }
  if (std::any_of(shape.begin(), shape.end(),
                  [](Index n) { return n == 0; })) {
    return absl::OkStatus();
  }
  const ChunkGrid grid = dest.chunk_grid();
  const DimensionIndex rank = grid.rank();
  const auto window = GetCopyWindow(grid, dest.dtype(), options);
  std::vector<std::vector<Index>> boundaries(rank);
  for (DimensionIndex d = 0; d < rank; ++d) {
    boundaries[d] = grid.boundaries(d);
  }
  ABSL_LOG_IF(INFO, persist_logging)
      << "Copying " << dest.dtype().name() << " array {"
      << absl::StrJoin(shape, ", ") << "} in windows of {"
      << absl::StrJoin(window, ", ") << "} chunks";

  // Index of the first chunk of the current window along each dimension.
  std::vector<Index> first_chunk(rank, 0);
  while (true) {
    std::vector<Index> origin(rank), extent(rank);
    for (DimensionIndex d = 0; d < rank; ++d) {
      const Index end_chunk =
          std::min<Index>(first_chunk[d] + window[d], grid.num_chunks(d));
      origin[d] = boundaries[d][first_chunk[d]];
      extent[d] = boundaries[d][end_chunk] - origin[d];
    }
    const Box box(origin, extent);
    CUBESTACK_ASSIGN_OR_RETURN(
        auto data, source.Read(box),
        MaybeAnnotateStatus(_, CopyRegionMessage(origin)));
    CUBESTACK_RETURN_IF_ERROR(
        dest.Write(origin, data),
        MaybeAnnotateStatus(_, CopyRegionMessage(origin)));

    DimensionIndex d = rank - 1;
    for (; d >= 0; --d) {
      first_chunk[d] += window[d];
      if (first_chunk[d] < grid.num_chunks(d)) break;
      first_chunk[d] = 0;
    }
    if (d < 0) break;
  }
  return absl::OkStatus();
}

}  // namespace cubestack
