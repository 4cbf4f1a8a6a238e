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

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"
#include "cubestack/chunk_grid.h"
#include "cubestack/cube.h"
#include "cubestack/driver/array_handle.h"
#include "cubestack/driver/memory/memory_array.h"
#include "cubestack/errors.h"
#include "cubestack/index.h"
#include "cubestack/persist/chunk_offset.h"
#include "cubestack/persist/storage_driver.h"
#include "cubestack/util/result.h"
#include "cubestack/util/status.h"

namespace cubestack {

class MemoryStorageDriver::MemoryLayout : public Layout {
 public:
  explicit MemoryLayout(std::string path, Attributes global_attributes)
      : path_(std::move(path)),
        global_attributes_(std::move(global_attributes)) {}

  Attributes global_attributes() const override { return global_attributes_; }

  std::vector<std::string> variable_names() const override {
    absl::MutexLock lock(&mutex_);
    std::vector<std::string> names;
    names.reserve(variables_.size());
    for (const auto& v : variables_) names.push_back(v.name);
    return names;
  }

  Result<std::vector<std::string>> GetDimensions(
      std::string_view name) const override {
    absl::MutexLock lock(&mutex_);
    CUBESTACK_ASSIGN_OR_RETURN(const auto* v, Find(name));
    return v->dimensions;
  }

  Result<Attributes> GetAttributes(std::string_view name) const override {
    absl::MutexLock lock(&mutex_);
    CUBESTACK_ASSIGN_OR_RETURN(const auto* v, Find(name));
    return v->attributes;
  }

  Result<WritableArrayHandlePtr> GetArray(
      std::string_view name) const override {
    absl::MutexLock lock(&mutex_);
    CUBESTACK_ASSIGN_OR_RETURN(const auto* v, Find(name));
    return WritableArrayHandlePtr(v->array);
  }

  /// Validates the new variables against the layout and adds them.  On error
  /// the layout is left unchanged.
  absl::Status Add(span<const StoredAxis> axes,
                   span<const VariableDescriptor> variables);

 private:
  struct Variable {
    std::string name;
    std::vector<std::string> dimensions;
    Attributes attributes;
    std::shared_ptr<MemoryArrayHandle> array;
  };

  Result<const Variable*> Find(std::string_view name) const
      ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    for (const auto& v : variables_) {
      if (v.name == name) return &v;
    }
    return absl::NotFoundError(
        absl::StrCat("Variable ", name, " not found in layout ", path_));
  }

  const std::string path_;
  const Attributes global_attributes_;
  mutable absl::Mutex mutex_;
  std::vector<Variable> variables_ ABSL_GUARDED_BY(mutex_);
  /// Length of every dimension, including dimensions without a coordinate
  /// variable.
  absl::flat_hash_map<std::string, Index> dimension_lengths_
      ABSL_GUARDED_BY(mutex_);
};

absl::Status MemoryStorageDriver::MemoryLayout::Add(
    span<const StoredAxis> axes, span<const VariableDescriptor> variables) {
  absl::MutexLock lock(&mutex_);
  auto lengths = dimension_lengths_;
  // Maps every variable name to whether it is added by this call.
  absl::flat_hash_map<std::string, bool> is_new;
  for (const auto& v : variables_) is_new[v.name] = false;
  std::vector<Variable> added;
  for (const auto& axis : axes) {
    if (axis.data.rank() != 1) {
      return absl::InvalidArgumentError(
          absl::StrCat("Coordinate variable ", axis.name, " has rank ",
                       axis.data.rank(), " but must have rank 1"));
    }
    const Index length = axis.data.shape()[0];
    auto existing = is_new.find(axis.name);
    if (existing != is_new.end() && existing->second) {
      return absl::InvalidArgumentError(
          absl::StrCat("Duplicate variable name \"", axis.name, "\""));
    }
    auto it = lengths.find(axis.name);
    if (it != lengths.end() && it->second != length) {
      return MakeError(
          ErrorKind::kSizeMismatch,
          absl::StrCat("Cannot append to layout ", path_, ": axis ",
                       axis.name, " has length ", length, " but ",
                       it->second, " positions are stored"));
    }
    if (existing != is_new.end()) {
      CUBESTACK_ASSIGN_OR_RETURN(const auto* v, Find(axis.name));
      if (v->dimensions.size() != 1 || v->dimensions[0] != axis.name) {
        return absl::InvalidArgumentError(
            absl::StrCat("Axis ", axis.name,
                         " collides with a data variable of layout ", path_));
      }
      continue;
    }
    CUBESTACK_ASSIGN_OR_RETURN(auto array, MemoryArrayHandle::Make(axis.data));
    is_new[axis.name] = true;
    lengths[axis.name] = length;
    added.push_back(
        Variable{axis.name, {axis.name}, axis.attributes, std::move(array)});
  }
  for (const auto& variable : variables) {
    auto existing = is_new.find(variable.name);
    if (existing != is_new.end()) {
      if (existing->second) {
        return absl::InvalidArgumentError(
            absl::StrCat("Duplicate variable name \"", variable.name, "\""));
      }
      return MakeError(ErrorKind::kVariableExists,
                       absl::StrCat("Variable ", variable.name,
                                    " already exists in layout ", path_));
    }
    const size_t rank = variable.dimensions.size();
    if (variable.shape.size() != rank || variable.chunk_shape.size() != rank) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Variable ", variable.name, " has ", rank, " dimensions but ",
          variable.shape.size(), " extents and ", variable.chunk_shape.size(),
          " chunk extents"));
    }
    for (size_t i = 0; i < rank; ++i) {
      const auto& dim = variable.dimensions[i];
      auto [it, inserted] = lengths.emplace(dim, variable.shape[i]);
      if (!inserted && it->second != variable.shape[i]) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Variable ", variable.name, " has extent ", variable.shape[i],
            " along dimension ", dim, " but dimension ", dim, " has length ",
            it->second));
      }
    }
    CUBESTACK_ASSIGN_OR_RETURN(
        auto grid, ChunkGrid::Regular(variable.shape, variable.chunk_shape),
        MaybeAnnotateStatus(_, absl::StrCat("Creating variable ",
                                            variable.name)));
    CUBESTACK_ASSIGN_OR_RETURN(
        auto array,
        MemoryArrayHandle::Allocate(variable.dtype, variable.shape,
                                    std::move(grid)));
    is_new[variable.name] = true;
    added.push_back(Variable{variable.name, variable.dimensions,
                             variable.attributes, std::move(array)});
  }
  for (auto& v : added) variables_.push_back(std::move(v));
  dimension_lengths_ = std::move(lengths);
  return absl::OkStatus();
}

bool MemoryStorageDriver::Exists(std::string_view path) const {
  absl::MutexLock lock(&mutex_);
  return layouts_.contains(path);
}

absl::Status MemoryStorageDriver::Delete(std::string_view path) {
  absl::MutexLock lock(&mutex_);
  auto it = layouts_.find(path);
  if (it == layouts_.end()) {
    return absl::NotFoundError(absl::StrCat("Layout ", path, " not found"));
  }
  layouts_.erase(it);
  return absl::OkStatus();
}

Result<LayoutPtr> MemoryStorageDriver::CreateLayout(
    std::string_view path, const Attributes& global_attributes,
    span<const StoredAxis> axes, span<const VariableDescriptor> variables) {
  absl::MutexLock lock(&mutex_);
  if (layouts_.contains(path)) {
    return absl::AlreadyExistsError(
        absl::StrCat("Layout ", path, " already exists"));
  }
  auto layout =
      std::make_shared<MemoryLayout>(std::string(path), global_attributes);
  CUBESTACK_RETURN_IF_ERROR(layout->Add(axes, variables));
  layouts_.emplace(std::string(path), layout);
  return LayoutPtr(std::move(layout));
}

Result<LayoutPtr> MemoryStorageDriver::AppendLayout(
    std::string_view path, span<const StoredAxis> axes,
    span<const VariableDescriptor> variables) {
  absl::MutexLock lock(&mutex_);
  auto it = layouts_.find(path);
  if (it == layouts_.end()) {
    return absl::NotFoundError(absl::StrCat("Layout ", path, " not found"));
  }
  CUBESTACK_RETURN_IF_ERROR(it->second->Add(axes, variables));
  return LayoutPtr(it->second);
}

Result<LayoutPtr> MemoryStorageDriver::OpenLayout(
    std::string_view path) const {
  absl::MutexLock lock(&mutex_);
  auto it = layouts_.find(path);
  if (it == layouts_.end()) {
    return absl::NotFoundError(absl::StrCat("Layout ", path, " not found"));
  }
  return LayoutPtr(it->second);
}

}  // namespace cubestack
