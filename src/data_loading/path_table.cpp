/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "data_loading/path_table.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include "utils/errors.hpp"

namespace data_loading {

PathTable::PathTable(size_t count, size_t width)
    : count_(count), width_(width), arena_(count * width, '\0') {
  if (width == 0) {
    throw std::invalid_argument("PathTable width must include the terminator byte");
  }
}

void PathTable::set(size_t index, std::string_view path) {
  if (index >= count_) {
    throw utils::IndexRangeError("Path index " + std::to_string(index) + " out of range [0, " +
                                 std::to_string(count_) + ")");
  }
  if (path.size() + 1 > width_) {
    throw std::length_error("Path of length " + std::to_string(path.size()) +
                            " does not fit a record of width " + std::to_string(width_));
  }
  char *record = arena_.data() + index * width_;
  std::memcpy(record, path.data(), path.size());
  std::fill(record + path.size(), record + width_, '\0');
}

std::string_view PathTable::get(size_t index) const {
  if (index >= count_) {
    throw utils::IndexRangeError("Path index " + std::to_string(index) + " out of range [0, " +
                                 std::to_string(count_) + ")");
  }
  const char *record = arena_.data() + index * width_;
  const char *end = std::find(record, record + width_, '\0');
  return std::string_view(record, static_cast<size_t>(end - record));
}

} // namespace data_loading
