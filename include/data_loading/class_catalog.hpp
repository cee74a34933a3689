/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "file_enumerator.hpp"

namespace data_loading {

/**
 * Ordered set of class names discovered from the subfolders of one or more data
 * paths. A folder name becomes a class the first time it is seen; later roots that
 * contain the same folder name contribute additional folders to that class.
 * Class ids are 0-based and follow discovery order.
 */
class ClassCatalog {
public:
  ClassCatalog() = default;

  static ClassCatalog discover(const std::vector<std::string> &data_paths,
                               const FileEnumerator &enumerator);

  size_t size() const { return names_.size(); }
  bool empty() const { return names_.empty(); }

  const std::vector<std::string> &names() const { return names_; }
  const std::string &name(size_t class_id) const;

  bool contains(const std::string &name) const { return ids_.count(name) > 0; }
  size_t id(const std::string &name) const;

  const std::vector<std::string> &folders(size_t class_id) const;

private:
  std::vector<std::string> names_;
  std::unordered_map<std::string, size_t> ids_;
  std::vector<std::vector<std::string>> folders_;
};

} // namespace data_loading
