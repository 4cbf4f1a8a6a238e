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

#include "cubestack/persist/save_dataset.h"

#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "cubestack/array.h"
#include "cubestack/axis.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/config.h"
#include "cubestack/cube.h"
#include "cubestack/data_type.h"
#include "cubestack/dataset.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/memory/memory_array.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/persist/chunk_offset.h"
#include "cubestack/persist/memory/memory_storage.h"
#include "cubestack/persist/storage_driver.h"
#include "cubestack/util/status_testutil.h"

namespace {

using ::cubestack::ArrayFromAxis;
using ::cubestack::ArraysEqual;
using ::cubestack::Attributes;
using ::cubestack::Axis;
using ::cubestack::ChunkGrid;
using ::cubestack::Config;
using ::cubestack::Cube;
using ::cubestack::Dataset;
using ::cubestack::dtype_v;
using ::cubestack::ErrorKind;
using ::cubestack::HasErrorKind;
using ::cubestack::Index;
using ::cubestack::MakeArray;
using ::cubestack::MatchesStatus;
using ::cubestack::MemoryArrayHandle;
using ::cubestack::MemoryStorageDriver;
using ::cubestack::OpenDataset;
using ::cubestack::OpenMultiDataset;
using ::cubestack::ReadAll;
using ::cubestack::SaveCube;
using ::cubestack::SaveDataset;
using ::cubestack::SaveOptions;
using ::cubestack::VariableDescriptor;
using ::testing::ElementsAre;

using Ints = std::vector<std::int64_t>;
using Strings = std::vector<std::string>;

Cube MakeCube(std::vector<Axis> axes, const std::vector<float>& values,
              std::optional<ChunkGrid> grid = {},
              Attributes attributes = Attributes::object()) {
  std::vector<Index> shape;
  for (const auto& axis : axes) shape.push_back(axis.size());
  auto handle =
      MemoryArrayHandle::Make(MakeArray<float>(shape, values), grid);
  EXPECT_TRUE(handle.ok()) << handle.status();
  auto cube = Cube::Make(std::move(axes), *handle, std::move(attributes));
  EXPECT_TRUE(cube.ok()) << cube.status();
  return *cube;
}

Dataset MakeDataset(std::vector<Dataset::Variable> variables,
                    Attributes properties = Attributes::object()) {
  auto dataset = Dataset::Make(std::move(variables), std::move(properties));
  EXPECT_TRUE(dataset.ok()) << dataset.status();
  return *dataset;
}

SaveOptions Path(std::string path) {
  SaveOptions options;
  options.path = std::move(path);
  return options;
}

const Axis kLon("lon", Ints{0, 1});
const Axis kTime("time", Ints{10, 20, 30});

Dataset MakeTestDataset() {
  std::vector<Dataset::Variable> variables;
  variables.emplace_back(
      "tas", MakeCube({kLon, kTime}, {1, 2, 3, 4, 5, 6}, {}, {{"units", "K"}}));
  variables.emplace_back("pr", MakeCube({kLon}, {7, 8}));
  return MakeDataset(std::move(variables), {{"title", "test"}});
}

TEST(SaveDatasetTest, SaveAndOpen) {
  MemoryStorageDriver driver;
  const auto dataset = MakeTestDataset();
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto stored, SaveDataset(dataset, Path("a.zarr"), driver, Config{}));
  EXPECT_THAT(stored.variable_names(), ElementsAre("tas", "pr"));
  EXPECT_EQ("test", stored.properties()["title"]);
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto tas, stored.GetCube("tas"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto tas_data, tas.Read());
  EXPECT_THAT(tas_data.ToVector<float>(), ElementsAre(1, 2, 3, 4, 5, 6));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened, OpenDataset(driver, "a.zarr"));
  EXPECT_THAT(opened.variable_names(), ElementsAre("tas", "pr"));
  EXPECT_EQ("test", opened.properties()["title"]);
  EXPECT_THAT(opened.GetAxis("time"), ::cubestack::IsOkAndHolds(kTime));
  EXPECT_THAT(opened.GetAxis("lon"), ::cubestack::IsOkAndHolds(kLon));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened_tas, opened.GetCube("tas"));
  EXPECT_EQ("K", opened_tas.attributes()["units"]);
  EXPECT_EQ("tas", opened_tas.attributes()["name"]);
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened_data, opened_tas.Read());
  EXPECT_TRUE(ArraysEqual(tas_data, opened_data));
}

TEST(SaveDatasetTest, ChunkOffsetPadding) {
  MemoryStorageDriver driver;
  const Axis time("time", Ints{10, 20, 30, 40, 50});
  const Index shape[] = {5};
  const Index chunks[] = {3};
  const Index offset[] = {1};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto grid,
                                 ChunkGrid::Regular(shape, chunks, offset));
  std::vector<Dataset::Variable> variables;
  variables.emplace_back("tas", MakeCube({time}, {1, 2, 3, 4, 5}, grid));
  CUBESTACK_ASSERT_OK(SaveDataset(MakeDataset(std::move(variables)),
                                  Path("a"), driver, Config{}));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto layout, driver.OpenLayout("a"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto stored_tas, layout->GetArray("tas"));
  EXPECT_THAT(stored_tas->shape(), ElementsAre(6));
  EXPECT_THAT(stored_tas->chunk_grid().extents(0), ElementsAre(3, 3));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto stored_time, layout->GetArray("time"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto time_data, ReadAll(*stored_time));
  EXPECT_THAT(time_data.ToVector<std::int64_t>(),
              ElementsAre(0, 10, 20, 30, 40, 50));
  EXPECT_THAT(layout->GetAttributes("time"),
              ::cubestack::IsOkAndHolds(
                  Attributes{{"_ARRAY_OFFSET", 1}}));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened, OpenDataset(driver, "a"));
  EXPECT_THAT(opened.GetAxis("time"), ::cubestack::IsOkAndHolds(time));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto tas, opened.GetCube("tas"));
  EXPECT_EQ(grid, tas.chunk_grid());
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto data, tas.Read());
  EXPECT_THAT(data.ToVector<float>(), ElementsAre(1, 2, 3, 4, 5));
}

TEST(SaveDatasetTest, ChunkOffsetConflict) {
  MemoryStorageDriver driver;
  const Index shape[] = {3};
  const Index chunks[] = {2};
  const Index offset[] = {1};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto grid,
                                 ChunkGrid::Regular(shape, chunks, offset));
  std::vector<Dataset::Variable> variables;
  variables.emplace_back("a", MakeCube({kTime}, {1, 2, 3}, grid));
  variables.emplace_back("b", MakeCube({kTime}, {1, 2, 3}));
  EXPECT_THAT(SaveDataset(MakeDataset(std::move(variables)), Path("x"),
                          driver, Config{}),
              HasErrorKind(ErrorKind::kChunkOffsetConflict));
  EXPECT_FALSE(driver.Exists("x"));
}

TEST(SaveDatasetTest, FailedOverwriteKeepsExistingLayout) {
  MemoryStorageDriver driver;
  CUBESTACK_ASSERT_OK(
      SaveDataset(MakeTestDataset(), Path("x"), driver, Config{}));

  const Index shape[] = {3};
  const Index chunks[] = {2};
  const Index offset[] = {1};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto grid,
                                 ChunkGrid::Regular(shape, chunks, offset));
  std::vector<Dataset::Variable> variables;
  variables.emplace_back("a", MakeCube({kTime}, {1, 2, 3}, grid));
  variables.emplace_back("b", MakeCube({kTime}, {1, 2, 3}));
  auto overwrite = Path("x");
  overwrite.overwrite = true;
  EXPECT_THAT(SaveDataset(MakeDataset(std::move(variables)), overwrite,
                          driver, Config{}),
              HasErrorKind(ErrorKind::kChunkOffsetConflict));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened, OpenDataset(driver, "x"));
  EXPECT_THAT(opened.variable_names(), ElementsAre("tas", "pr"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto pr, opened.GetCube("pr"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto pr_data, pr.Read());
  EXPECT_THAT(pr_data.ToVector<float>(), ElementsAre(7, 8));
}

TEST(SaveDatasetTest, ExistingPath) {
  MemoryStorageDriver driver;
  const auto dataset = MakeTestDataset();
  CUBESTACK_ASSERT_OK(SaveDataset(dataset, Path("a"), driver, Config{}));
  EXPECT_THAT(SaveDataset(dataset, Path("a"), driver, Config{}),
              MatchesStatus(absl::StatusCode::kAlreadyExists,
                            "Path a already exists; .*"));

  auto overwrite = Path("a");
  overwrite.overwrite = true;
  std::vector<Dataset::Variable> replacement;
  replacement.emplace_back("pr", MakeCube({kLon}, {1, 2}));
  CUBESTACK_ASSERT_OK(SaveDataset(MakeDataset(std::move(replacement)),
                                  overwrite, driver, Config{}));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened, OpenDataset(driver, "a"));
  EXPECT_THAT(opened.variable_names(), ElementsAre("pr"));
}

TEST(SaveDatasetTest, Append) {
  MemoryStorageDriver driver;
  CUBESTACK_ASSERT_OK(
      SaveDataset(MakeTestDataset(), Path("a"), driver, Config{}));

  auto append = Path("a");
  append.append = true;
  std::vector<Dataset::Variable> more;
  more.emplace_back("evap", MakeCube({kTime}, {4, 5, 6}));
  more.emplace_back("depth", MakeCube({Axis("z", Ints{1, 2})}, {7, 8}));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto appended,
      SaveDataset(MakeDataset(std::move(more)), append, driver, Config{}));
  EXPECT_THAT(appended.variable_names(), ElementsAre("evap", "depth"));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened, OpenDataset(driver, "a"));
  EXPECT_THAT(opened.variable_names(),
              ElementsAre("tas", "pr", "evap", "depth"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto evap, opened.GetCube("evap"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto data, evap.Read());
  EXPECT_THAT(data.ToVector<float>(), ElementsAre(4, 5, 6));

  std::vector<Dataset::Variable> existing;
  existing.emplace_back("pr", MakeCube({kLon}, {1, 2}));
  EXPECT_THAT(SaveDataset(MakeDataset(std::move(existing)), append, driver,
                          Config{}),
              HasErrorKind(ErrorKind::kVariableExists));

  std::vector<Dataset::Variable> longer;
  longer.emplace_back("snow",
                      MakeCube({Axis("time", Ints{10, 20, 30, 40})},
                               {1, 2, 3, 4}));
  EXPECT_THAT(SaveDataset(MakeDataset(std::move(longer)), append, driver,
                          Config{}),
              HasErrorKind(ErrorKind::kSizeMismatch));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(opened, OpenDataset(driver, "a"));
  EXPECT_EQ(4, opened.num_variables());
}

TEST(SaveDatasetTest, Skeleton) {
  MemoryStorageDriver driver;
  auto options = Path("a");
  options.skeleton = true;
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto stored, SaveDataset(MakeTestDataset(), options, driver, Config{}));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto pr, stored.GetCube("pr"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto data, pr.Read());
  for (float v : data.ToVector<float>()) EXPECT_TRUE(std::isnan(v));
}

TEST(SaveDatasetTest, ResolvesAgainstWorkingDirectory) {
  MemoryStorageDriver driver;
  Config config;
  config.working_directory = "/data";
  CUBESTACK_ASSERT_OK(
      SaveDataset(MakeTestDataset(), Path("a.zarr"), driver, config));
  EXPECT_TRUE(driver.Exists("/data/a.zarr"));
  EXPECT_THAT(SaveDataset(MakeTestDataset(), Path(""), driver, config),
              MatchesStatus(absl::StatusCode::kInvalidArgument));
}

TEST(SaveDatasetTest, BoundedCopy) {
  MemoryStorageDriver driver;
  const Axis time("time", Ints{1, 2, 3, 4});
  const Index shape[] = {4};
  const Index chunks[] = {1};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto grid, ChunkGrid::Regular(shape, chunks));
  std::vector<Dataset::Variable> variables;
  variables.emplace_back("tas", MakeCube({time}, {1, 2, 3, 4}, grid));
  const auto dataset = MakeDataset(std::move(variables));
  Config config;
  config.max_cache_bytes = 2 * 4;
  config.write_factor = 1;
  CUBESTACK_ASSERT_OK(SaveDataset(dataset, Path("a"), driver, config));
  EXPECT_EQ(2, std::static_pointer_cast<const MemoryArrayHandle>(
                   dataset.variables()[0].second.handle())
                   ->read_count());
}

TEST(SaveCubeTest, SplitsAndJoins) {
  MemoryStorageDriver driver;
  const Axis variables("Variables", Strings{"tas", "pr"});
  const auto cube = MakeCube({kLon, variables}, {1, 2, 3, 4});
  CUBESTACK_ASSERT_OK_AND_ASSIGN(
      auto stored, SaveCube(cube, Path("a"), driver, Config{}));
  EXPECT_THAT(stored.axis_names(), ElementsAre("lon", "Variables"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto data, stored.Read());
  EXPECT_THAT(data.ToVector<float>(), ElementsAre(1, 2, 3, 4));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened, OpenDataset(driver, "a"));
  EXPECT_THAT(opened.variable_names(), ElementsAre("tas", "pr"));
}

TEST(OpenDatasetTest, SkipsBoundsAndCoordinates) {
  MemoryStorageDriver driver;
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto time, ArrayFromAxis(kTime, 0));
  const ::cubestack::StoredAxis axes[] = {time};
  auto make_variable = [](std::string name, std::vector<std::string> dims,
                          std::vector<Index> shape) {
    VariableDescriptor v;
    v.name = std::move(name);
    v.dtype = dtype_v<double>;
    v.dimensions = std::move(dims);
    v.chunk_shape = shape;
    v.shape = std::move(shape);
    v.attributes = Attributes::object();
    return v;
  };
  const VariableDescriptor variables[] = {
      make_variable("tas", {"time", "member"}, {3, 2}),
      make_variable("time_bnds", {"time", "bnds"}, {3, 2}),
      make_variable("Time", {"time"}, {3}),
      make_variable("extra", {"time"}, {3}),
  };
  CUBESTACK_ASSERT_OK(driver.CreateLayout("a", {}, axes, variables));

  const std::string skip_keys[] = {"extra"};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto opened,
                                 OpenDataset(driver, "a", skip_keys));
  EXPECT_THAT(opened.variable_names(), ElementsAre("tas"));
  EXPECT_THAT(opened.GetAxis("member"),
              ::cubestack::IsOkAndHolds(Axis::Positional("member", 2)));
  EXPECT_THAT(opened.GetAxis("time"), ::cubestack::IsOkAndHolds(kTime));
  EXPECT_THAT(opened.GetAxis("bnds"),
              MatchesStatus(absl::StatusCode::kNotFound));
  EXPECT_TRUE(opened.properties().is_object());
}

TEST(OpenDatasetTest, Errors) {
  MemoryStorageDriver driver;
  EXPECT_THAT(OpenDataset(driver, "missing"),
              MatchesStatus(absl::StatusCode::kNotFound));
  CUBESTACK_ASSERT_OK(driver.CreateLayout("empty", {}, {}, {}));
  EXPECT_THAT(OpenDataset(driver, "empty"),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Layout empty does not contain any variables"));
}

TEST(OpenMultiDatasetTest, MergesAlongTime) {
  MemoryStorageDriver driver;
  for (std::int64_t t : {2, 1}) {
    std::vector<Dataset::Variable> variables;
    variables.emplace_back(
        "tas", MakeCube({kLon, Axis("time", Ints{t})},
                        {static_cast<float>(t), static_cast<float>(10 * t)}));
    CUBESTACK_ASSERT_OK(SaveDataset(MakeDataset(std::move(variables)),
                                    Path(absl::StrCat("t", t)), driver,
                                    Config{}));
  }
  const std::string paths[] = {"t2", "t1"};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto merged,
                                 OpenMultiDataset(driver, paths));
  EXPECT_THAT(merged.GetAxis("time"),
              ::cubestack::IsOkAndHolds(Axis("time", Ints{1, 2})));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto tas, merged.GetCube("tas"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto data, tas.Read());
  EXPECT_THAT(data.ToVector<float>(), ElementsAre(1, 2, 10, 20));
}

}  // namespace
