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

#ifndef CUBESTACK_PERSIST_STORAGE_DRIVER_H_
#define CUBESTACK_PERSIST_STORAGE_DRIVER_H_

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/status/status.h"
#include "cubestack/cube.h"
#include "cubestack/data_type.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/index.h"
#include "cubestack/persist/chunk_offset.h"
#include "cubestack/util/result.h"

namespace cubestack {

/// Describes a data variable to be created in a layout.
struct VariableDescriptor {
  std::string name;
  DataType dtype;
  /// Names of the axes along each dimension.
  std::vector<std::string> dimensions;
  /// Stored shape, including chunk offset padding.
  std::vector<Index> shape;
  std::vector<Index> chunk_shape;
  Attributes attributes;
};

/// Persisted collection of named, chunked variables plus global attributes.
///
/// Coordinate variables of axes are ordinary one-dimensional variables whose
/// single dimension has the name of the variable.
class Layout {
 public:
  virtual ~Layout() = default;

  virtual Attributes global_attributes() const = 0;

  /// Returns the names of all variables, coordinate variables included, in
  /// creation order.
  virtual std::vector<std::string> variable_names() const = 0;

  /// \error `absl::StatusCode::kNotFound` if there is no such variable.
  virtual Result<std::vector<std::string>> GetDimensions(
      std::string_view name) const = 0;

  /// \error `absl::StatusCode::kNotFound` if there is no such variable.
  virtual Result<Attributes> GetAttributes(std::string_view name) const = 0;

  /// Returns a handle to the stored data, with the stored chunk grid.
  ///
  /// \error `absl::StatusCode::kNotFound` if there is no such variable.
  virtual Result<WritableArrayHandlePtr> GetArray(
      std::string_view name) const = 0;
};

using LayoutPtr = std::shared_ptr<Layout>;

/// Creates, extends and opens layouts addressed by path.
class StorageDriver {
 public:
  virtual ~StorageDriver() = default;

  virtual bool Exists(std::string_view path) const = 0;

  /// \error `absl::StatusCode::kNotFound` if there is no layout at `path`.
  virtual absl::Status Delete(std::string_view path) = 0;

  /// Creates a layout with the given coordinate and data variables.  Data
  /// variables are filled with the missing value of their data type.
  ///
  /// \error `absl::StatusCode::kAlreadyExists` if `path` exists.
  /// \error `absl::StatusCode::kInvalidArgument` if names collide or a
  ///     variable does not match the length of its axes.
  virtual Result<LayoutPtr> CreateLayout(
      std::string_view path, const Attributes& global_attributes,
      span<const StoredAxis> axes,
      span<const VariableDescriptor> variables) = 0;

  /// Adds coordinate and data variables to the existing layout at `path`.
  /// Axes that already exist are not rewritten.  Nothing is written if an
  /// error is returned.
  ///
  /// \error `absl::StatusCode::kNotFound` if there is no layout at `path`.
  /// \error `ErrorKind::kSizeMismatch` if an axis that already exists has a
  ///     different length.
  /// \error `ErrorKind::kVariableExists` if a data variable already exists.
  virtual Result<LayoutPtr> AppendLayout(
      std::string_view path, span<const StoredAxis> axes,
      span<const VariableDescriptor> variables) = 0;

  /// \error `absl::StatusCode::kNotFound` if there is no layout at `path`.
  virtual Result<LayoutPtr> OpenLayout(std::string_view path) const = 0;
};

}  // namespace cubestack

#endif  // CUBESTACK_PERSIST_STORAGE_DRIVER_H_
