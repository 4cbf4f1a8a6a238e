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

#ifndef CUBESTACK_PERSIST_SAVE_DATASET_H_
#define CUBESTACK_PERSIST_SAVE_DATASET_H_

#include <string>
#include <string_view>

#include "cubestack/config.h"
#include "cubestack/cube.h"
#include "cubestack/dataset.h"
#include "cubestack/index.h"
#include "cubestack/persist/storage_driver.h"
#include "cubestack/util/result.h"

namespace cubestack {

struct SaveOptions {
  /// Destination, resolved against `Config::working_directory`.
  std::string path;

  /// Delete an existing layout at `path` before writing.
  bool overwrite = false;

  /// Add the variables to an existing layout at `path`.
  bool append = false;

  /// Create the layout but do not copy any data.
  bool skeleton = false;
};

/// Writes `dataset` to `driver` and returns the dataset as stored.
///
/// Every variable is stored with the chunking of its data handle.  Axes whose
/// first chunk is partial are padded with leading positions, recorded in the
/// `_ARRAY_OFFSET` attribute of the coordinate variable; the returned dataset
/// hides the padding.  All validation happens before the layout is created or
/// extended.  Data is copied in windows bounded by `config.max_cache_bytes`
/// and `config.write_factor`.
///
/// \error `absl::StatusCode::kAlreadyExists` if the path exists and neither
///     `overwrite` nor `append` is set.
/// \error `ErrorKind::kChunkOffsetConflict` if two variables sharing an axis
///     have different chunk offsets.
/// \error `ErrorKind::kSizeMismatch` or `ErrorKind::kVariableExists` if the
///     dataset cannot be appended to the existing layout.
Result<Dataset> SaveDataset(const Dataset& dataset, const SaveOptions& options,
                            StorageDriver& driver, const Config& config);

/// Saves `cube` split along `dataset_axis` as by `ToDataset`, then joins the
/// stored variables back into one cube.
Result<Cube> SaveCube(const Cube& cube, const SaveOptions& options,
                      StorageDriver& driver, const Config& config,
                      std::string_view dataset_axis = "Variables");

/// Opens the layout at `path` as a dataset.
///
/// Variables named in `skip_keys`, bounds variables (names containing `BNDS`
/// or `BOUNDS`, ignoring case) and coordinate variables are not loaded.
/// Dimensions without a coordinate variable become positional axes.  Leading
/// chunk offset padding is removed.  Variables without a `name` attribute
/// receive their variable name.
///
/// \error `absl::StatusCode::kNotFound` if there is no layout at `path`.
/// \error `absl::StatusCode::kInvalidArgument` if the layout is empty.
/// \error `ErrorKind::kShapeMismatch` if variables sharing a dimension have
///     different stored lengths along it.
Result<Dataset> OpenDataset(const StorageDriver& driver, std::string_view path,
                            span<const std::string> skip_keys = {});

/// Opens every path with `OpenDataset` and merges the results with
/// `MergeDatasets`.
Result<Dataset> OpenMultiDataset(const StorageDriver& driver,
                                 span<const std::string> paths,
                                 span<const std::string> skip_keys = {});

}  // namespace cubestack

#endif  // CUBESTACK_PERSIST_SAVE_DATASET_H_
