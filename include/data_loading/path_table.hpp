/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace data_loading {

/**
 * Fixed-width table of NUL-terminated paths stored in one contiguous arena.
 * Record i lives at bytes [i * width, (i + 1) * width). The width is the longest
 * path plus one terminator byte, which keeps the memory of a 10M+ file index
 * bounded and free of per-string allocations.
 */
class PathTable {
public:
  PathTable() = default;
  PathTable(size_t count, size_t width);

  void set(size_t index, std::string_view path);
  std::string_view get(size_t index) const;
  std::string path(size_t index) const { return std::string(get(index)); }

  size_t size() const { return count_; }
  size_t width() const { return width_; }
  size_t memory_bytes() const { return arena_.size(); }

private:
  size_t count_ = 0;
  size_t width_ = 0;
  std::vector<char> arena_;
};

} // namespace data_loading
