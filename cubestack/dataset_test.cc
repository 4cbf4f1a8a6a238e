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

#include "cubestack/dataset.h"

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include <nlohmann/json.hpp>
#include "cubestack/array.h"
#include "cubestack/axis.h"
#include "cubestack/config.h"
#include "cubestack/cube.h"
#include "cubestack/driver/memory/memory_array.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/util/status_testutil.h"

namespace {

using ::cubestack::ArraysEqual;
using ::cubestack::Attributes;
using ::cubestack::Axis;
using ::cubestack::AxisRange;
using ::cubestack::ChunkSizes;
using ::cubestack::Config;
using ::cubestack::Cube;
using ::cubestack::Dataset;
using ::cubestack::ErrorKind;
using ::cubestack::HasErrorKind;
using ::cubestack::Index;
using ::cubestack::MakeArray;
using ::cubestack::MatchesStatus;
using ::cubestack::MemoryArrayHandle;
using ::cubestack::ReadDataset;
using ::cubestack::ToCube;
using ::cubestack::ToDataset;
using ::testing::ElementsAre;

using Ints = std::vector<std::int64_t>;
using Strings = std::vector<std::string>;

template <typename T>
Cube MakeCube(std::vector<Axis> axes, const std::vector<T>& values,
              Attributes attributes = Attributes::object()) {
  std::vector<Index> shape;
  for (const auto& axis : axes) shape.push_back(axis.size());
  auto handle = MemoryArrayHandle::Make(MakeArray<T>(shape, values));
  EXPECT_TRUE(handle.ok()) << handle.status();
  auto cube = Cube::Make(std::move(axes), *handle, std::move(attributes));
  EXPECT_TRUE(cube.ok()) << cube.status();
  return *cube;
}

const Axis kLon("lon", Ints{0, 1, 2});
const Axis kTime("time", Ints{100, 200});
const Axis kDepth("depth", Ints{5});

Dataset MakeTestDataset() {
  std::vector<Dataset::Variable> variables;
  variables.emplace_back(
      "Temperature", MakeCube<float>({kLon, kTime}, {1, 2, 3, 4, 5, 6}));
  variables.emplace_back(
      "Precipitation", MakeCube<float>({kLon, kTime}, {6, 5, 4, 3, 2, 1}));
  variables.emplace_back("Soil",
                         MakeCube<float>({kLon, kTime, kDepth},
                                         {9, 8, 7, 6, 5, 4},
                                         {{"units", "K"}}));
  auto dataset = Dataset::Make(std::move(variables), {{"source", "test"}});
  EXPECT_TRUE(dataset.ok()) << dataset.status();
  return *dataset;
}

TEST(DatasetTest, Make) {
  auto dataset = MakeTestDataset();
  EXPECT_EQ(3, dataset.num_variables());
  EXPECT_THAT(dataset.variable_names(),
              ElementsAre("Temperature", "Precipitation", "Soil"));
  EXPECT_EQ(3, dataset.axes().size());
  EXPECT_THAT(dataset.GetAxis("time"), ::cubestack::IsOkAndHolds(kTime));
  EXPECT_THAT(dataset.GetAxis("lat"),
              MatchesStatus(absl::StatusCode::kNotFound, "Axis lat not found"));
  EXPECT_NE(nullptr, dataset.FindCube("Soil"));
  EXPECT_EQ(nullptr, dataset.FindCube("soil"));
  EXPECT_THAT(dataset.GetCube("Wind"),
              MatchesStatus(absl::StatusCode::kNotFound,
                            "Variable Wind not found"));
  EXPECT_EQ("test", dataset.properties()["source"]);
}

TEST(DatasetTest, MakeErrors) {
  std::vector<Dataset::Variable> duplicates;
  duplicates.emplace_back("a", MakeCube<float>({kDepth}, {1}));
  duplicates.emplace_back("a", MakeCube<float>({kDepth}, {2}));
  EXPECT_THAT(Dataset::Make(duplicates),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Duplicate variable name \"a\""));

  std::vector<Dataset::Variable> conflicting;
  conflicting.emplace_back("a", MakeCube<float>({kDepth}, {1}));
  conflicting.emplace_back(
      "b", MakeCube<float>({Axis("depth", Ints{6})}, {2}));
  EXPECT_THAT(Dataset::Make(conflicting),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Variable b has axis depth that differs .*"));

  EXPECT_THAT(Dataset::Make({}, Attributes::array()),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Properties must be an object.*"));
}

TEST(DatasetTest, Select) {
  auto dataset = MakeTestDataset();
  const std::string names[] = {"soil", "temp"};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto selected, dataset.Select(names));
  EXPECT_THAT(selected.variable_names(), ElementsAre("Soil", "Temperature"));
  EXPECT_EQ(dataset.properties(), selected.properties());

  const std::string unknown[] = {"wind"};
  EXPECT_THAT(dataset.Select(unknown),
              MatchesStatus(absl::StatusCode::kNotFound,
                            "Name wind not found"));
  // "" is a prefix of every variable name.
  const std::string ambiguous[] = {""};
  EXPECT_THAT(dataset.Select(ambiguous),
              MatchesStatus(absl::StatusCode::kNotFound));
}

TEST(DatasetTest, Subset) {
  auto dataset = MakeTestDataset();
  const AxisRange ranges[] = {{"lon", 1, 2}, {"depth", 0, 1}};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto subset, dataset.Subset(ranges));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto lon, subset.GetAxis("lon"));
  EXPECT_EQ(Axis("lon", Ints{1}), lon);
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto temperature,
                                 subset.GetCube("Temperature"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto data, temperature.Read());
  EXPECT_THAT(data.ToVector<float>(), ElementsAre(3, 4));

  const AxisRange bad[] = {{"time", 0, 5}};
  EXPECT_THAT(dataset.Subset(bad),
              MatchesStatus(absl::StatusCode::kOutOfRange,
                            "Subsetting variable Temperature: .*"));
}

TEST(DatasetTest, SetChunks) {
  auto dataset = MakeTestDataset();
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto all,
                                 dataset.SetChunks(ChunkSizes{{"lon", 2}}));
  for (const auto& [name, cube] : all.variables()) {
    EXPECT_THAT(cube.chunk_grid().extents(0), ElementsAre(2, 1)) << name;
  }

  absl::btree_map<std::string, ChunkSizes> per_variable;
  per_variable["Soil"] = {{"time", 1}};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto some, dataset.SetChunks(per_variable));
  EXPECT_THAT(some.FindCube("Soil")->chunk_grid().extents(1),
              ElementsAre(1, 1));
  EXPECT_THAT(some.FindCube("Temperature")->chunk_grid().extents(1),
              ElementsAre(2));
}

TEST(DatasetTest, Print) {
  std::ostringstream os;
  os << MakeTestDataset();
  EXPECT_EQ(
      "Dataset\n"
      "Shared Axes:\n"
      "  lon regular int64[3] 0:2\n"
      "  time regular int64[2] 100:200\n"
      "Variables:\n"
      "Precipitation, Temperature\n"
      "Variables with additional axes:\n"
      "  Additional Axes:\n"
      "    depth regular int64[1] 5\n"
      "  Variables:\n"
      "  Soil\n"
      "Properties: {\"source\":\"test\"}\n",
      os.str());
}

TEST(ToDatasetTest, SplitAndJoin) {
  const Axis variables("Variables", Strings{"a", "b"});
  auto cube = MakeCube<std::int32_t>({kTime, variables, kDepth}, {1, 2, 3, 4},
                                     {{"units", "mm"}});
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto dataset, ToDataset(cube));
  EXPECT_THAT(dataset.variable_names(), ElementsAre("a", "b"));
  EXPECT_EQ(Attributes::array({0, 2, 1}), dataset.properties()["_CubePerm"]);
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto b, dataset.GetCube("b"));
  EXPECT_THAT(b.axis_names(), ElementsAre("time", "depth"));
  EXPECT_EQ("mm", b.attributes()["units"]);
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto b_data, b.Read());
  EXPECT_THAT(b_data.ToVector<std::int32_t>(), ElementsAre(2, 4));

  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto joined, ToCube(dataset));
  EXPECT_THAT(joined.axis_names(), ElementsAre("time", "depth", "Variables"));
  EXPECT_EQ(variables, joined.axes()[2]);
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto joined_data, joined.Read());
  EXPECT_THAT(joined_data.ToVector<std::int32_t>(), ElementsAre(1, 2, 3, 4));
}

TEST(ToDatasetTest, NoDatasetAxis) {
  auto cube = MakeCube<float>({kDepth}, {1});
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto dataset, ToDataset(cube));
  EXPECT_THAT(dataset.variable_names(), ElementsAre("layer"));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto same, ToCube(dataset));
  EXPECT_EQ(cube.handle(), same.handle());
}

TEST(ToCubeTest, JoinsOnlyFullVariables) {
  // Soil has an extra axis, so only Temperature and Precipitation span all
  // axes of a dataset without it.
  auto dataset = MakeTestDataset();
  const std::string names[] = {"Temperature", "Precipitation"};
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto selected, dataset.Select(names));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto cube, ToCube(selected, "var"));
  EXPECT_THAT(cube.shape(), ElementsAre(3, 2, 2));
  EXPECT_EQ(Axis("var", Strings{"Temperature", "Precipitation"}),
            cube.axes()[2]);
  EXPECT_FALSE(cube.attributes().contains("name"));

  // Only Soil spans lon, time and depth.
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto soil, ToCube(dataset));
  EXPECT_EQ(dataset.FindCube("Soil")->handle(), soil.handle());
}

TEST(ToCubeTest, Errors) {
  std::vector<Dataset::Variable> mixed;
  mixed.emplace_back("a", MakeCube<float>({kDepth}, {1}));
  mixed.emplace_back("b", MakeCube<std::int32_t>({kDepth}, {1}));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto mixed_dataset, Dataset::Make(mixed));
  EXPECT_THAT(ToCube(mixed_dataset),
              MatchesStatus(absl::StatusCode::kInvalidArgument,
                            "Cannot join variable b of type int32 with "
                            "variables of type float32"));

  std::vector<Dataset::Variable> transposed;
  transposed.emplace_back("a", MakeCube<float>({kDepth, kTime}, {1, 2}));
  transposed.emplace_back("b", MakeCube<float>({kTime, kDepth}, {1, 2}));
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto transposed_dataset,
                                 Dataset::Make(transposed));
  EXPECT_THAT(ToCube(transposed_dataset),
              HasErrorKind(ErrorKind::kShapeMismatch));
}

TEST(ReadDatasetTest, Materializes) {
  auto dataset = MakeTestDataset();
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto chunked,
                                 dataset.SetChunks(ChunkSizes{{"lon", 1}}));
  Config config;
  // Smaller than the data, so a warning is logged.
  config.max_cache_bytes = 8;
  CUBESTACK_ASSERT_OK_AND_ASSIGN(auto loaded, ReadDataset(chunked, config));
  EXPECT_EQ(chunked.variable_names(), loaded.variable_names());
  EXPECT_EQ(chunked.properties(), loaded.properties());
  for (const auto& [name, cube] : chunked.variables()) {
    const Cube* in_memory = loaded.FindCube(name);
    ASSERT_NE(nullptr, in_memory);
    EXPECT_NE(cube.handle(), in_memory->handle());
    EXPECT_EQ(cube.chunk_grid(), in_memory->chunk_grid());
    CUBESTACK_ASSERT_OK_AND_ASSIGN(auto expected, cube.Read());
    CUBESTACK_ASSERT_OK_AND_ASSIGN(auto actual, in_memory->Read());
    EXPECT_TRUE(ArraysEqual(expected, actual)) << name;
  }
}

}  // namespace
