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

#include "cubestack/driver/subset_array.h"

#include <cmath>
#include <cstdint>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "cubestack/array.h"
#include "cubestack/box.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/memory/memory_array.h"
#include "cubestack/driver/missing_array.h"
#include "cubestack/index.h"
#include "cubestack/util/status_testutil.h"

namespace {

using ::cubestack::Box;
using ::cubestack::ChunkGrid;
using ::cubestack::dtype_v;
using ::cubestack::Index;
using ::cubestack::MakeArray;
using ::cubestack::MakeChunkView;
using ::cubestack::MakeMissingArrayHandle;
using ::cubestack::MakeNewAxisArrayHandle;
using ::cubestack::MakeSliceArrayHandle;
using ::cubestack::MakeSubsetArrayHandle;
using ::cubestack::MakeWritableSubsetArrayHandle;
using ::cubestack::MatchesStatus;
using ::cubestack::MemoryArrayHandle;
using ::cubestack::ReadAll;
using ::testing::ElementsAre;

TEST(SubsetArrayHandleTest, TranslatesReads) {
  const Index shape[] = {10};
  const Index chunks[] = {4};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto grid, ChunkGrid::Regular(shape, chunks));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto base,
      MemoryArrayHandle::Make(
          MakeArray<int32_t>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}), grid));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto subset,
                                 MakeSubsetArrayHandle(base, Box({3}, {6})));
  EXPECT_THAT(subset->shape(), ElementsAre(6));
  EXPECT_THAT(subset->chunk_grid().extents(0), ElementsAre(1, 4, 1));
  EXPECT_EQ(3, subset->chunk_grid().grid_offset(0));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto all, ReadAll(*subset));
  EXPECT_THAT(all.ToVector<int32_t>(), ElementsAre(3, 4, 5, 6, 7, 8));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto part, subset->Read(Box({4}, {2})));
  EXPECT_THAT(part.ToVector<int32_t>(), ElementsAre(7, 8));
  EXPECT_THAT(subset->Read(Box({4}, {3})),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

TEST(SubsetArrayHandleTest, OutOfBounds) {
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto base, MemoryArrayHandle::Make(MakeArray<int32_t>({1, 2, 3})));
  EXPECT_THAT(MakeSubsetArrayHandle(base, Box({2}, {2})),
              MatchesStatus(absl::StatusCode::kOutOfRange,
                            "Cannot take subset of array: .*"));
}

TEST(SubsetArrayHandleTest, Writable) {
  const Index shape[] = {6};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto base, MemoryArrayHandle::Allocate(dtype_v<int32_t>, shape));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto subset, MakeWritableSubsetArrayHandle(base, Box({2}, {3})));
  const Index origin[] = {1};
  CUBESTACK_EXPECT_OK(subset->Write(origin, MakeArray<int32_t>({7, 8})));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto all, ReadAll(*base));
  EXPECT_THAT(all.ToVector<int32_t>(),
              ElementsAre(2147483647, 2147483647, 2147483647, 7, 8,
                          2147483647));
  const Index outside[] = {2};
  EXPECT_THAT(subset->Write(outside, MakeArray<int32_t>({7, 8})),
              MatchesStatus(absl::StatusCode::kOutOfRange,
                            "Cannot write to subset of array: .*"));
  EXPECT_EQ(1, base->write_count());
}

TEST(ChunkViewTest, RedescribesChunks) {
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto base, MemoryArrayHandle::Make(MakeArray<double>({1, 2, 3, 4})));
  const Index shape[] = {4};
  const Index chunks[] = {2};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto grid, ChunkGrid::Regular(shape, chunks));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto view, MakeChunkView(base, grid));
  EXPECT_EQ(grid, view->chunk_grid());
  EXPECT_EQ(0, base->read_count());
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto all, ReadAll(*view));
  EXPECT_THAT(all.ToVector<double>(), ElementsAre(1, 2, 3, 4));

  const Index wrong_shape[] = {5};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto wrong,
                                 ChunkGrid::Regular(wrong_shape, chunks));
  EXPECT_THAT(MakeChunkView(base, wrong),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(NewAxisArrayHandleTest, InsertsUnitDimension) {
  const Index shape[] = {2, 3};
  const Index chunks[] = {1, 3};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto grid, ChunkGrid::Regular(shape, chunks));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto base,
      MemoryArrayHandle::Make(MakeArray<int32_t>({2, 3}, {1, 2, 3, 4, 5, 6}),
                              grid));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto last, MakeNewAxisArrayHandle(base, 2));
  EXPECT_THAT(last->shape(), ElementsAre(2, 3, 1));
  EXPECT_THAT(last->chunk_grid().extents(0), ElementsAre(1, 1));
  EXPECT_THAT(last->chunk_grid().extents(2), ElementsAre(1));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto middle, MakeNewAxisArrayHandle(base, 1));
  EXPECT_THAT(middle->shape(), ElementsAre(2, 1, 3));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto part,
                                 middle->Read(Box({1, 0, 1}, {1, 1, 2})));
  EXPECT_THAT(part.shape(), ElementsAre(1, 1, 2));
  EXPECT_THAT(part.ToVector<int32_t>(), ElementsAre(5, 6));
  EXPECT_THAT(MakeNewAxisArrayHandle(base, 3),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(SliceArrayHandleTest, RemovesDimension) {
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto base,
      MemoryArrayHandle::Make(MakeArray<int32_t>({2, 3}, {1, 2, 3, 4, 5, 6})));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto column, MakeSliceArrayHandle(base, 1, 2));
  EXPECT_THAT(column->shape(), ElementsAre(2));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto all, ReadAll(*column));
  EXPECT_THAT(all.ToVector<int32_t>(), ElementsAre(3, 6));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto row, MakeSliceArrayHandle(base, 0, 1));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto part, row->Read(Box({1}, {2})));
  EXPECT_THAT(part.ToVector<int32_t>(), ElementsAre(5, 6));
  EXPECT_THAT(MakeSliceArrayHandle(base, 1, 3),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(MakeSliceArrayHandle(base, 2, 0),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(MissingArrayHandleTest, ReadsMissingValues) {
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto handle, MakeMissingArrayHandle(dtype_v<float>, {2, 3}));
  EXPECT_THAT(handle->shape(), ElementsAre(2, 3));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto block, handle->Read(Box({0, 1}, {2, 2})));
  EXPECT_THAT(block.shape(), ElementsAre(2, 2));
  for (float v : block.ToVector<float>()) EXPECT_TRUE(std::isnan(v));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto ints, MakeMissingArrayHandle(dtype_v<uint8_t>, {2}));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto all, ReadAll(*ints));
  EXPECT_THAT(all.ToVector<uint8_t>(), ElementsAre(255, 255));
}

TEST(MissingArrayHandleTest, Errors) {
  EXPECT_THAT(MakeMissingArrayHandle(cubestack::DataType(), {2}),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  const ChunkGrid wrong_grid(std::vector<std::vector<Index>>{{1, 2}});
  EXPECT_THAT(MakeMissingArrayHandle(dtype_v<float>, {2}, wrong_grid),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

}  // namespace
