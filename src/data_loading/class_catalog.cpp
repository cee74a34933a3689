/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "data_loading/class_catalog.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include "utils/errors.hpp"

namespace data_loading {

ClassCatalog ClassCatalog::discover(const std::vector<std::string> &data_paths,
                                    const FileEnumerator &enumerator) {
  ClassCatalog catalog;
  for (const auto &root : data_paths) {
    for (const auto &folder_name : enumerator.list_subfolders(root)) {
      const std::string folder = (std::filesystem::path(root) / folder_name).string();

      auto it = catalog.ids_.find(folder_name);
      size_t class_id;
      if (it == catalog.ids_.end()) {
        class_id = catalog.names_.size();
        catalog.names_.push_back(folder_name);
        catalog.ids_.emplace(folder_name, class_id);
        catalog.folders_.emplace_back();
      } else {
        class_id = it->second;
      }

      auto &class_folders = catalog.folders_[class_id];
      if (std::find(class_folders.begin(), class_folders.end(), folder) == class_folders.end()) {
        class_folders.push_back(folder);
      }
    }
  }
  return catalog;
}

const std::string &ClassCatalog::name(size_t class_id) const {
  if (class_id >= names_.size()) {
    throw utils::IndexRangeError("Class id " + std::to_string(class_id) + " out of range [0, " +
                                 std::to_string(names_.size()) + ")");
  }
  return names_[class_id];
}

size_t ClassCatalog::id(const std::string &name) const {
  auto it = ids_.find(name);
  if (it == ids_.end()) {
    throw std::invalid_argument("Unknown class: " + name);
  }
  return it->second;
}

const std::vector<std::string> &ClassCatalog::folders(size_t class_id) const {
  if (class_id >= folders_.size()) {
    throw utils::IndexRangeError("Class id " + std::to_string(class_id) + " out of range [0, " +
                                 std::to_string(folders_.size()) + ")");
  }
  return folders_[class_id];
}

} // namespace data_loading
