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

#ifndef CUBESTACK_DATASET_H_
#define CUBESTACK_DATASET_H_

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "cubestack/axis.h"
#include "cubestack/config.h"
#include "cubestack/cube.h"
#include "cubestack/index.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Named collection of cubes sharing a set of axes, plus global properties.
///
/// Variables keep their insertion order.  Every axis referenced by a cube is
/// identical to the dataset's axis of the same name.  Datasets are immutable
/// values; derived datasets share the data handles of their inputs.
class Dataset {
 public:
  using Variable = std::pair<std::string, Cube>;

  Dataset() = default;

  /// Constructs a dataset from named cubes, collecting their axes.
  ///
  /// \error `absl::StatusCode::kInvalidArgument` if variable names are not
  ///     unique, if two cubes have different axes of the same name, or if
  ///     `properties` is not an object.
  static Result<Dataset> Make(std::vector<Variable> variables,
                              Attributes properties = Attributes::object());

  const std::vector<Variable>& variables() const { return variables_; }
  std::vector<std::string> variable_names() const;
  const absl::btree_map<std::string, Axis>& axes() const { return axes_; }
  const Attributes& properties() const { return properties_; }

  size_t num_variables() const { return variables_.size(); }

  /// Returns the cube named `name`, or `nullptr`.
  const Cube* FindCube(std::string_view name) const;

  /// \error `absl::StatusCode::kNotFound` if there is no such variable.
  Result<Cube> GetCube(std::string_view name) const;

  /// \error `absl::StatusCode::kNotFound` if there is no such axis.
  Result<Axis> GetAxis(std::string_view name) const;

  /// Returns a dataset with only the named variables.
  ///
  /// Each name selects the single variable whose name starts with it,
  /// ignoring case.
  ///
  /// \error `absl::StatusCode::kNotFound` if a name matches no variable or
  ///     more than one.
  Result<Dataset> Select(span<const std::string> names) const;

  /// Selects index ranges along named axes of every cube that has them.
  Result<Dataset> Subset(span<const AxisRange> ranges) const;

  /// Re-describes the chunking of all variables.
  Result<Dataset> SetChunks(const ChunkSizes& chunk_sizes) const;

  /// Re-describes the chunking of the named variables; other variables are
  /// unchanged.
  Result<Dataset> SetChunks(
      const absl::btree_map<std::string, ChunkSizes>& chunk_sizes) const;

  friend std::ostream& operator<<(std::ostream& os, const Dataset& dataset);

 private:
  std::vector<Variable> variables_;
  absl::btree_map<std::string, Axis> axes_;
  Attributes properties_ = Attributes::object();
};

/// Property recording the axis order of a cube split by `ToDataset`.
constexpr std::string_view kCubePermProperty = "_CubePerm";

/// Splits `cube` into a dataset.
///
/// If `cube` has an axis named `dataset_axis`, every position of that axis
/// becomes one variable named after the axis value, and the property
/// `_CubePerm` records where the axis stood.  Otherwise the dataset has the
/// single variable `layer_name`.
Result<Dataset> ToDataset(const Cube& cube,
                          std::string_view dataset_axis = "Variables",
                          std::string_view layer_name = "layer");

/// Joins the variables of `dataset` that span all of its axes into one cube,
/// stacked along a new categorical axis `join_name` labelled by variable
/// name.
///
/// A dataset with one such variable returns it unchanged.
///
/// \error `absl::StatusCode::kInvalidArgument` if the variables to join have
///     different data types, or if no variable spans all axes.
/// \error `ErrorKind::kShapeMismatch` if they order their axes differently.
Result<Cube> ToCube(const Dataset& dataset,
                    std::string_view join_name = "Variables");

/// Reads every variable of `dataset` into memory.
///
/// Logs a warning if the total size exceeds `config.max_cache_bytes`.
Result<Dataset> ReadDataset(const Dataset& dataset, const Config& config);

}  // namespace cubestack

#endif  // CUBESTACK_DATASET_H_
