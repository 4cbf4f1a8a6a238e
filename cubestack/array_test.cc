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

#include <cmath>
#include <cstdint>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "cubestack/box.h"
#include "cubestack/data_type.h"
#include "cubestack/index.h"
#include "cubestack/util/status_testutil.h"

namespace {

using ::cubestack::AllocateArray;
using ::cubestack::AllocateMissingArray;
using ::cubestack::ArraysEqual;
using ::cubestack::Box;
using ::cubestack::CopyArrayRegion;
using ::cubestack::dtype_v;
using ::cubestack::Index;
using ::cubestack::MakeArray;
using ::cubestack::MatchesStatus;
using ::cubestack::SharedArray;
using ::cubestack::SubArray;
using ::testing::ElementsAre;

TEST(SharedArrayTest, MakeAndGet) {
  auto array = MakeArray<int32_t>({2, 3}, {1, 2, 3, 4, 5, 6});
  EXPECT_EQ(dtype_v<int32_t>, array.dtype());
  EXPECT_THAT(array.shape(), ElementsAre(2, 3));
  EXPECT_EQ(6, array.num_elements());
  EXPECT_EQ(24, array.num_bytes());
  EXPECT_EQ(1, array.Get<int32_t>({0, 0}));
  EXPECT_EQ(6, array.Get<int32_t>({1, 2}));
  EXPECT_EQ(4, array.Get<int32_t>({1, 0}));
}

TEST(SharedArrayTest, AllocateMissing) {
  const Index shape[] = {2, 2};
  auto floats = AllocateMissingArray(dtype_v<float>, shape);
  for (float v : floats.ToVector<float>()) EXPECT_TRUE(std::isnan(v));
  auto ints = AllocateMissingArray(dtype_v<int16_t>, shape);
  EXPECT_THAT(ints.ToVector<int16_t>(),
              ElementsAre(32767, 32767, 32767, 32767));
}

TEST(CopyArrayRegionTest, Basic) {
  auto source = MakeArray<int32_t>({3, 3}, {1, 2, 3, 4, 5, 6, 7, 8, 9});
  const Index dest_shape[] = {2, 4};
  auto dest = AllocateArray(dtype_v<int32_t>, dest_shape);
  const Index dest_origin[] = {0, 1};
  CUBESTACK_ASSERT_OK(
      CopyArrayRegion(source, Box({1, 1}, {2, 2}), dest, dest_origin));
  EXPECT_THAT(dest.ToVector<int32_t>(), ElementsAre(0, 5, 6, 0, 0, 8, 9, 0));
}

TEST(CopyArrayRegionTest, Errors) {
  auto source = MakeArray<int32_t>({1, 2, 3});
  auto dest = MakeArray<float>({1, 2, 3});
  const Index origin[] = {0};
  EXPECT_THAT(CopyArrayRegion(source, Box({3}), dest, origin),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
  auto dest2 = MakeArray<int32_t>({0, 0});
  EXPECT_THAT(CopyArrayRegion(source, Box({3}), dest2, origin),
              MatchesStatus(absl::StatusCode::kOutOfRange));
  EXPECT_THAT(CopyArrayRegion(source, Box({2}, {2}), dest2, origin),
              MatchesStatus(absl::StatusCode::kOutOfRange));
}

TEST(SubArrayTest, Basic) {
  auto source = MakeArray<double>({2, 3}, {1, 2, 3, 4, 5, 6});
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto sub,
                                 SubArray(source, Box({0, 1}, {2, 1})));
  EXPECT_TRUE(ArraysEqual(sub, MakeArray<double>({2, 1}, {2, 5})));
}

TEST(ArraysEqualTest, Basic) {
  const auto a = MakeArray<int64_t>({1, 2});
  EXPECT_TRUE(ArraysEqual(a, MakeArray<int64_t>({1, 2})));
  EXPECT_FALSE(ArraysEqual(a, MakeArray<int64_t>({1, 3})));
  EXPECT_FALSE(ArraysEqual(a, MakeArray<int32_t>({1, 2})));
  EXPECT_FALSE(ArraysEqual(a, MakeArray<int64_t>({1, 2}, {1, 2})));
}

}  // namespace
