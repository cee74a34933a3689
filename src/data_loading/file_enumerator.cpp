/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "data_loading/file_enumerator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace data_loading {

namespace {

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

size_t walk(const fs::path &directory, const FileEnumerator::Visitor &visit) {
  std::vector<fs::directory_entry> entries;
  for (const auto &entry : fs::directory_iterator(directory)) {
    entries.push_back(entry);
  }
  std::sort(entries.begin(), entries.end(),
            [](const fs::directory_entry &a, const fs::directory_entry &b) {
              return a.path().filename() < b.path().filename();
            });

  size_t visited = 0;
  for (const auto &entry : entries) {
    if (entry.is_directory()) {
      if (!entry.is_symlink()) {
        visited += walk(entry.path(), visit);
      }
      continue;
    }
    const std::string path = entry.path().string();
    if (FileEnumerator::has_image_extension(path)) {
      visit(path);
      ++visited;
    }
  }
  return visited;
}

} // namespace

const std::vector<std::string> &FileEnumerator::image_extensions() {
  static const std::vector<std::string> extensions = {"jpg", "jpeg", "png", "ppm", "bmp"};
  return extensions;
}

bool FileEnumerator::has_image_extension(const std::string &path) {
  const size_t dot = path.find_last_of('.');
  const size_t slash = path.find_last_of("/\\");
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return false;
  }
  const std::string extension = to_lower(path.substr(dot + 1));
  const auto &extensions = image_extensions();
  return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
}

std::vector<std::string> FilesystemEnumerator::list_subfolders(const std::string &root) const {
  if (!fs::is_directory(root)) {
    throw std::runtime_error("Data path is not a directory: " + root);
  }
  std::vector<std::string> names;
  for (const auto &entry : fs::directory_iterator(root)) {
    if (entry.is_directory()) {
      names.push_back(entry.path().filename().string());
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

size_t FilesystemEnumerator::for_each_image(const std::string &folder,
                                            const Visitor &visit) const {
  if (!fs::is_directory(folder)) {
    throw std::runtime_error("Class folder is not a directory: " + folder);
  }
  return walk(fs::path(folder), visit);
}

} // namespace data_loading
