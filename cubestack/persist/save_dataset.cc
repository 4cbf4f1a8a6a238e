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

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/container/btree_map.h"
#include "absl/log/absl_log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "cubestack/axis.h"
#include "cubestack/box.h"
#include "cubestack/config.h"
#include "cubestack/cube.h"
#include "cubestack/dataset.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/subset_array.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/internal/log/verbose_flag.h"
#include "cubestack/merge/merge_datasets.h"
#include "cubestack/persist/chunk_offset.h"
#include "cubestack/persist/copy_array.h"
#include "cubestack/persist/storage_driver.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {
namespace {

ABSL_CONST_INIT internal_log::VerboseFlag persist_logging("persist");

/// Returns the region of a stored variable holding its logical data.
Box LogicalRegion(const ArrayInfo& info, const ChunkOffsets& offsets) {
  std::vector<Index> origin;
  for (const auto& name : info.axis_names) origin.push_back(offsets.at(name));
  return Box(std::move(origin), info.shape);
}

VariableDescriptor GetVariableDescriptor(const ArrayInfo& info,
                                         const ChunkOffsets& offsets) {
  VariableDescriptor descriptor;
  descriptor.name = info.name;
  descriptor.dtype = info.dtype;
  descriptor.dimensions = info.axis_names;
  descriptor.chunk_shape = info.chunk_shape;
  for (size_t i = 0; i < info.shape.size(); ++i) {
    descriptor.shape.push_back(info.shape[i] +
                               offsets.at(info.axis_names[i]));
  }
  descriptor.attributes = info.attributes;
  return descriptor;
}

bool IsBoundsDimension(std::string_view name) {
  return absl::StrContains(name, "bnd") || absl::StrContains(name, "bounds");
}

bool IsBoundsVariable(std::string_view name) {
  const std::string upper = absl::AsciiStrToUpper(name);
  return absl::StrContains(upper, "BNDS") || absl::StrContains(upper, "BOUNDS");
}

struct StoredDimension {
  Index offset;
  /// Stored length, including the offset.
  Index length;
  /// Variable that first declared the dimension.
  std::string declared_by;
};

/// Collects the dimensions of all variables of `layout`, except bounds
/// dimensions.
Result<absl::btree_map<std::string, StoredDimension>> CollectDimensions(
    const Layout& layout, span<const std::string> names) {
  absl::btree_map<std::string, StoredDimension> dimensions;
  for (const auto& name : names) {
    CUBESTACK_ASSIGN_OR_RETURN(auto dims, layout.GetDimensions(name));
    CUBESTACK_ASSIGN_OR_RETURN(auto array, layout.GetArray(name));
    const auto shape = array->shape();
    for (size_t i = 0; i < dims.size(); ++i) {
      const auto& dim = dims[i];
      if (IsBoundsDimension(dim)) continue;
      auto it = dimensions.find(dim);
      if (it != dimensions.end()) {
        if (it->second.length != shape[i]) {
          return MakeError(
              ErrorKind::kShapeMismatch,
              absl::StrCat("Variable ", name, " has stored length ", shape[i],
                           " along dimension ", dim, " but variable ",
                           it->second.declared_by, " has stored length ",
                           it->second.length));
        }
        continue;
      }
      Index offset = 0;
      if (absl::c_linear_search(names, dim)) {
        CUBESTACK_ASSIGN_OR_RETURN(auto attributes, layout.GetAttributes(dim));
        CUBESTACK_ASSIGN_OR_RETURN(
            offset, GetArrayOffset(attributes),
            MaybeAnnotateStatus(_, absl::StrCat("Reading axis ", dim)));
      }
      dimensions.emplace(dim, StoredDimension{offset, shape[i], name});
    }
  }
  return dimensions;
}

Result<Axis> ReadAxis(const Layout& layout, span<const std::string> names,
                      const std::string& dim, const StoredDimension& stored) {
  if (!absl::c_linear_search(names, dim)) {
    return Axis::Positional(dim, stored.length - stored.offset);
  }
  CUBESTACK_ASSIGN_OR_RETURN(auto array, layout.GetArray(dim));
  CUBESTACK_ASSIGN_OR_RETURN(auto attributes, layout.GetAttributes(dim));
  CUBESTACK_ASSIGN_OR_RETURN(auto data, ReadAll(*array));
  return AxisFromStored(dim, data, attributes);
}

}  // namespace

Result<Dataset> SaveDataset(const Dataset& dataset, const SaveOptions& options,
                            StorageDriver& driver, const Config& config) {
  if (options.path.empty()) {
    return absl::InvalidArgumentError("Cannot save dataset to empty path");
  }
  const std::string path = ResolvePath(config, options.path);
  const bool exists = driver.Exists(path);
  if (exists && !options.overwrite && !options.append) {
    return absl::AlreadyExistsError(
        absl::StrCat("Path ", path,
                     " already exists; set overwrite or append to write "
                     "to it"));
  }
  const bool append = exists && !options.overwrite;

  std::vector<ArrayInfo> infos;
  for (const auto& [name, cube] : dataset.variables()) {
    infos.push_back(GetArrayInfo(name, cube));
  }
  CUBESTACK_ASSIGN_OR_RETURN(auto offsets, ReconcileChunkOffsets(infos));
  std::vector<StoredAxis> axes;
  for (const auto& [name, axis] : dataset.axes()) {
    auto it = offsets.find(name);
    CUBESTACK_ASSIGN_OR_RETURN(
        auto stored, ArrayFromAxis(axis, it == offsets.end() ? 0 : it->second));
    axes.push_back(std::move(stored));
  }
  std::vector<VariableDescriptor> variables;
  for (const auto& info : infos) {
    variables.push_back(GetVariableDescriptor(info, offsets));
  }

  // Nothing is removed until the stored layout has been fully described.
  if (exists && options.overwrite) {
    ABSL_LOG_IF(INFO, persist_logging) << "Deleting " << path;
    CUBESTACK_RETURN_IF_ERROR(driver.Delete(path));
  }

  LayoutPtr layout;
  if (append) {
    ABSL_LOG_IF(INFO, persist_logging)
        << "Appending " << variables.size() << " variables to " << path;
    CUBESTACK_ASSIGN_OR_RETURN(layout,
                               driver.AppendLayout(path, axes, variables));
  } else {
    ABSL_LOG_IF(INFO, persist_logging)
        << "Creating " << path << " with " << variables.size()
        << " variables";
    CUBESTACK_ASSIGN_OR_RETURN(
        layout,
        driver.CreateLayout(path, dataset.properties(), axes, variables));
  }

  std::vector<Dataset::Variable> stored_variables;
  std::vector<WritableArrayHandlePtr> targets;
  for (size_t i = 0; i < infos.size(); ++i) {
    const auto& [name, cube] = dataset.variables()[i];
    CUBESTACK_ASSIGN_OR_RETURN(auto array, layout->GetArray(name));
    CUBESTACK_ASSIGN_OR_RETURN(
        auto target, MakeWritableSubsetArrayHandle(
                         std::move(array), LogicalRegion(infos[i], offsets)));
    CUBESTACK_ASSIGN_OR_RETURN(
        auto stored, Cube::Make(cube.axes(), target, cube.attributes()));
    stored_variables.emplace_back(name, std::move(stored));
    targets.push_back(std::move(target));
  }
  auto global_attributes = layout->global_attributes();
  if (!global_attributes.is_object()) global_attributes = Attributes::object();
  CUBESTACK_ASSIGN_OR_RETURN(auto result,
                             Dataset::Make(std::move(stored_variables),
                                           std::move(global_attributes)));
  if (options.skeleton) return result;

  CopyOptions copy_options;
  copy_options.max_buffer_bytes = config.max_cache_bytes;
  copy_options.write_factor = config.write_factor;
  for (size_t i = 0; i < targets.size(); ++i) {
    const auto& [name, cube] = dataset.variables()[i];
    CUBESTACK_RETURN_IF_ERROR(
        CopyArray(*cube.handle(), *targets[i], copy_options),
        MaybeAnnotateStatus(_, absl::StrCat("Writing variable ", name)));
  }
  return result;
}

Result<Cube> SaveCube(const Cube& cube, const SaveOptions& options,
                      StorageDriver& driver, const Config& config,
                      std::string_view dataset_axis) {
  std::string layer_name = "layer";
  auto it = cube.attributes().find("name");
  if (it != cube.attributes().end() && it->is_string()) {
    layer_name = it->get<std::string>();
  }
  CUBESTACK_ASSIGN_OR_RETURN(auto dataset,
                             ToDataset(cube, dataset_axis, layer_name));
  CUBESTACK_ASSIGN_OR_RETURN(auto stored,
                             SaveDataset(dataset, options, driver, config));
  return ToCube(stored, dataset_axis);
}

Result<Dataset> OpenDataset(const StorageDriver& driver, std::string_view path,
                            span<const std::string> skip_keys) {
  CUBESTACK_ASSIGN_OR_RETURN(auto layout, driver.OpenLayout(path));
  const auto names = layout->variable_names();
  if (names.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Layout ", path, " does not contain any variables"));
  }
  CUBESTACK_ASSIGN_OR_RETURN(auto dimensions,
                             CollectDimensions(*layout, names));
  absl::btree_map<std::string, Axis> axes;
  for (const auto& [dim, stored] : dimensions) {
    CUBESTACK_ASSIGN_OR_RETURN(auto axis,
                               ReadAxis(*layout, names, dim, stored));
    axes.emplace(dim, std::move(axis));
  }

  std::vector<Dataset::Variable> variables;
  for (const auto& name : names) {
    if (absl::c_linear_search(skip_keys, name) || IsBoundsVariable(name)) {
      continue;
    }
    if (absl::c_any_of(dimensions, [&](const auto& d) {
          return absl::EqualsIgnoreCase(d.first, name);
        })) {
      continue;
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto dims, layout->GetDimensions(name));
    std::vector<Axis> cube_axes;
    std::vector<Index> origin;
    std::vector<Index> shape;
    for (const auto& dim : dims) {
      auto it = dimensions.find(dim);
      if (it == dimensions.end()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Variable ", name, " has bounds dimension ", dim));
      }
      cube_axes.push_back(axes.at(dim));
      origin.push_back(it->second.offset);
      shape.push_back(it->second.length - it->second.offset);
    }
    CUBESTACK_ASSIGN_OR_RETURN(WritableArrayHandlePtr array,
                               layout->GetArray(name));
    ArrayHandlePtr handle = std::move(array);
    if (absl::c_any_of(origin, [](Index o) { return o != 0; })) {
      CUBESTACK_ASSIGN_OR_RETURN(
          handle, MakeSubsetArrayHandle(std::move(handle),
                                        Box(std::move(origin), shape)));
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto attributes, layout->GetAttributes(name));
    if (!attributes.is_object()) attributes = Attributes::object();
    if (!attributes.contains("name")) attributes["name"] = name;
    CUBESTACK_ASSIGN_OR_RETURN(
        auto cube,
        Cube::Make(std::move(cube_axes), std::move(handle),
                   std::move(attributes)),
        MaybeAnnotateStatus(_, absl::StrCat("Opening variable ", name)));
    variables.emplace_back(name, std::move(cube));
  }
  auto properties = layout->global_attributes();
  if (!properties.is_object()) properties = Attributes::object();
  ABSL_LOG_IF(INFO, persist_logging)
      << "Opened " << path << " with " << variables.size() << " variables";
  return Dataset::Make(std::move(variables), std::move(properties));
}

Result<Dataset> OpenMultiDataset(const StorageDriver& driver,
                                 span<const std::string> paths,
                                 span<const std::string> skip_keys) {
  std::vector<Dataset> sources;
  for (const auto& path : paths) {
    CUBESTACK_ASSIGN_OR_RETURN(auto source,
                               OpenDataset(driver, path, skip_keys));
    sources.push_back(std::move(source));
  }
  return MergeDatasets(sources);
}

}  // namespace cubestack
