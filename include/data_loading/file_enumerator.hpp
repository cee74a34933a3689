/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <functional>
#include <string>
#include <vector>

namespace data_loading {

/**
 * Lists class folders and the image files below them.
 * Implementations must stream files to the visitor instead of returning them, so
 * that corpora with tens of millions of images never sit in process memory.
 */
class FileEnumerator {
public:
  using Visitor = std::function<void(const std::string &path)>;

  virtual ~FileEnumerator() = default;

  /**
   * Names of the immediate subfolders of `root`, in the order they should become
   * classes.
   */
  virtual std::vector<std::string> list_subfolders(const std::string &root) const = 0;

  /**
   * Calls `visit` once for every image file below `folder` (recursively).
   * @return number of files visited
   */
  virtual size_t for_each_image(const std::string &folder, const Visitor &visit) const = 0;

  // Case-insensitive match against jpg, jpeg, png, ppm and bmp.
  static bool has_image_extension(const std::string &path);
  static const std::vector<std::string> &image_extensions();
};

/**
 * Native recursive walk. Entries of each directory are visited in lexicographic
 * order so that the resulting index is deterministic; only one directory listing
 * is held in memory at a time. Symlinked directories are not followed.
 */
class FilesystemEnumerator : public FileEnumerator {
public:
  std::vector<std::string> list_subfolders(const std::string &root) const override;
  size_t for_each_image(const std::string &folder, const Visitor &visit) const override;
};

} // namespace data_loading
