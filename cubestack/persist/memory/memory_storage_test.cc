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

#include "cubestack/persist/memory/memory_storage.h"

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "cubestack/array.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/persist/chunk_offset.h"
#include "cubestack/persist/storage_driver.h"
#include "cubestack/util/status_testutil.h"

namespace {

using ::cubestack::Attributes;
using ::cubestack::dtype_v;
using ::cubestack::ErrorKind;
using ::cubestack::HasErrorKind;
using ::cubestack::Index;
using ::cubestack::MakeArray;
using ::cubestack::MatchesStatus;
using ::cubestack::MemoryStorageDriver;
using ::cubestack::ReadAll;
using ::cubestack::StoredAxis;
using ::cubestack::VariableDescriptor;
using ::testing::ElementsAre;

StoredAxis MakeAxis(std::string name, std::vector<std::int64_t> values) {
  return StoredAxis{std::move(name), MakeArray(values),
                    {{"_ARRAY_OFFSET", 0}}};
}

VariableDescriptor MakeVariable(std::string name,
                                std::vector<std::string> dimensions,
                                std::vector<Index> shape,
                                std::vector<Index> chunk_shape) {
  VariableDescriptor v;
  v.name = std::move(name);
  v.dtype = dtype_v<float>;
  v.dimensions = std::move(dimensions);
  v.shape = std::move(shape);
  v.chunk_shape = std::move(chunk_shape);
  v.attributes = {{"units", "K"}};
  return v;
}

TEST(MemoryStorageDriverTest, CreateAndOpen) {
  MemoryStorageDriver driver;
  EXPECT_FALSE(driver.Exists("a.zarr"));
  const StoredAxis axes[] = {MakeAxis("time", {0, 1, 2, 3}),
                             MakeAxis("lon", {10, 20})};
  const VariableDescriptor variables[] = {
      MakeVariable("tas", {"time", "lon"}, {4, 2}, {3, 2})};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto created,
      driver.CreateLayout("a.zarr", {{"title", "test"}}, axes, variables));
  EXPECT_TRUE(driver.Exists("a.zarr"));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto layout, driver.OpenLayout("a.zarr"));
  EXPECT_EQ(created, layout);
  EXPECT_EQ("test", layout->global_attributes()["title"]);
  EXPECT_THAT(layout->variable_names(), ElementsAre("time", "lon", "tas"));
  EXPECT_THAT(layout->GetDimensions("tas"),
              ::cubestack::IsOkAndHolds(ElementsAre("time", "lon")));
  EXPECT_THAT(layout->GetDimensions("lon"),
              ::cubestack::IsOkAndHolds(ElementsAre("lon")));
  EXPECT_THAT(layout->GetAttributes("tas"),
              ::cubestack::IsOkAndHolds(Attributes{{"units", "K"}}));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto tas, layout->GetArray("tas"));
  EXPECT_EQ(dtype_v<float>, tas->dtype());
  EXPECT_THAT(tas->shape(), ElementsAre(4, 2));
  EXPECT_THAT(tas->chunk_grid().extents(0), ElementsAre(3, 1));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto data, ReadAll(*tas));
  for (float v : data.ToVector<float>()) EXPECT_TRUE(std::isnan(v));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto lon, layout->GetArray("lon"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto lon_data, ReadAll(*lon));
  EXPECT_THAT(lon_data.ToVector<std::int64_t>(), ElementsAre(10, 20));

  EXPECT_THAT(layout->GetArray("pr"),
              MatchesStatus(absl::StatusCode::kNotFound,
                            "Variable pr not found in layout a.zarr"));
}

TEST(MemoryStorageDriverTest, CreateErrors) {
  MemoryStorageDriver driver;
  const StoredAxis axes[] = {MakeAxis("time", {0, 1, 2})};
  {
    const VariableDescriptor variables[] = {
        MakeVariable("tas", {"time"}, {4}, {4})};
    EXPECT_THAT(driver.CreateLayout("x", {}, axes, variables),
                MatchesStatus(absl::StatusCode::kInvalidArgument,
                              "Variable tas has extent 4 along dimension "
                              "time but dimension time has length 3"));
  }
  {
    const VariableDescriptor variables[] = {
        MakeVariable("tas", {"member"}, {3}, {3}),
        MakeVariable("pr", {"member"}, {2}, {2})};
    EXPECT_THAT(driver.CreateLayout("x", {}, axes, variables),
                MatchesStatus(absl::StatusCode::kInvalidArgument,
                              "Variable pr has extent 2 along dimension "
                              "member but dimension member has length 3"));
  }
  {
    const VariableDescriptor variables[] = {
        MakeVariable("time", {"time"}, {3}, {3})};
    EXPECT_THAT(driver.CreateLayout("x", {}, axes, variables),
                MatchesStatus(absl::StatusCode::kInvalidArgument,
                              "Duplicate variable name \"time\""));
  }
  EXPECT_FALSE(driver.Exists("x"));

  CUBESTACK_EXPECT_OK(driver.CreateLayout("x", {}, axes, {}));
  EXPECT_THAT(driver.CreateLayout("x", {}, axes, {}),
              MatchesStatus(absl::StatusCode::kAlreadyExists,
                            "Layout x already exists"));
}

TEST(MemoryStorageDriverTest, DimensionWithoutCoordinateVariable) {
  MemoryStorageDriver driver;
  const VariableDescriptor variables[] = {
      MakeVariable("tas", {"member"}, {3}, {2})};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto layout,
                                 driver.CreateLayout("x", {}, {}, variables));
  EXPECT_THAT(layout->variable_names(), ElementsAre("tas"));

  const StoredAxis longer[] = {MakeAxis("member", {1, 2, 3, 4})};
  EXPECT_THAT(driver.AppendLayout("x", longer, {}),
              HasErrorKind(ErrorKind::kSizeMismatch));
  const StoredAxis matching[] = {MakeAxis("member", {1, 2, 3})};
  CUBESTACK_EXPECT_OK(driver.AppendLayout("x", matching, {}));
  EXPECT_THAT(layout->variable_names(), ElementsAre("tas", "member"));
}

TEST(MemoryStorageDriverTest, Append) {
  MemoryStorageDriver driver;
  const StoredAxis axes[] = {MakeAxis("time", {0, 1, 2})};
  const VariableDescriptor tas[] = {MakeVariable("tas", {"time"}, {3}, {2})};
  CUBESTACK_ASSERT_OK(driver.CreateLayout("x", {}, axes, tas));

  const StoredAxis more_axes[] = {MakeAxis("time", {0, 1, 2}),
                                  MakeAxis("lat", {5, 6})};
  const VariableDescriptor pr[] = {
      MakeVariable("pr", {"time", "lat"}, {3, 2}, {3, 2})};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto layout,
                                 driver.AppendLayout("x", more_axes, pr));
  EXPECT_THAT(layout->variable_names(),
              ElementsAre("time", "tas", "lat", "pr"));
}

TEST(MemoryStorageDriverTest, AppendErrorsLeaveLayoutUnchanged) {
  MemoryStorageDriver driver;
  const StoredAxis axes[] = {MakeAxis("time", {0, 1, 2})};
  const VariableDescriptor tas[] = {MakeVariable("tas", {"time"}, {3}, {2})};
  CUBESTACK_ASSERT_OK(driver.CreateLayout("x", {}, axes, tas));

  const StoredAxis longer[] = {MakeAxis("lat", {1}),
                               MakeAxis("time", {0, 1, 2, 3})};
  EXPECT_THAT(driver.AppendLayout("x", longer, {}),
              MatchesStatus(absl::StatusCode::kFailedPrecondition,
                            "Cannot append to layout x: axis time has "
                            "length 4 but 3 positions are stored"));
  EXPECT_THAT(driver.AppendLayout("x", longer, {}),
              HasErrorKind(ErrorKind::kSizeMismatch));

  EXPECT_THAT(driver.AppendLayout("x", axes, tas),
              MatchesStatus(absl::StatusCode::kFailedPrecondition,
                            "Variable tas already exists in layout x"));
  EXPECT_THAT(driver.AppendLayout("x", axes, tas),
              HasErrorKind(ErrorKind::kVariableExists));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto layout, driver.OpenLayout("x"));
  EXPECT_THAT(layout->variable_names(), ElementsAre("time", "tas"));

  EXPECT_THAT(driver.AppendLayout("y", axes, {}),
              MatchesStatus(absl::StatusCode::kNotFound));
}

TEST(MemoryStorageDriverTest, Delete) {
  MemoryStorageDriver driver;
  CUBESTACK_ASSERT_OK(driver.CreateLayout("x", {}, {}, {}));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto layout, driver.OpenLayout("x"));
  CUBESTACK_EXPECT_OK(driver.Delete("x"));
  EXPECT_FALSE(driver.Exists("x"));
  EXPECT_THAT(driver.OpenLayout("x"),
              MatchesStatus(absl::StatusCode::kNotFound, "Layout x not found"));
  EXPECT_THAT(driver.Delete("x"), MatchesStatus(absl::StatusCode::kNotFound));
  // Layouts stay valid while referenced.
  EXPECT_TRUE(layout->variable_names().empty());
}

}  // namespace
