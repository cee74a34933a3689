/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "utils/errors.hpp"

namespace data_loading {

// Inclusive range [start, stop] of 0-based sample indices.
struct IndexRange {
  size_t start;
  size_t stop;
};

using IndexSelector = std::variant<size_t, IndexRange, std::vector<size_t>>;

/**
 * Expands a selector into the explicit list of indices it names, validating every
 * index against [0, n).
 */
inline std::vector<size_t> resolve_indices(const IndexSelector &selector, size_t n) {
  std::vector<size_t> indices;
  if (const size_t *single = std::get_if<size_t>(&selector)) {
    indices.push_back(*single);
  } else if (const IndexRange *range = std::get_if<IndexRange>(&selector)) {
    if (range->start > range->stop) {
      throw utils::IndexRangeError("Invalid range: start " + std::to_string(range->start) +
                                   " > stop " + std::to_string(range->stop));
    }
    if (range->stop >= n) {
      throw utils::IndexRangeError("Range stop " + std::to_string(range->stop) +
                                   " out of range [0, " + std::to_string(n) + ")");
    }
    indices.reserve(range->stop - range->start + 1);
    for (size_t i = range->start; i <= range->stop; ++i) {
      indices.push_back(i);
    }
  } else {
    indices = std::get<std::vector<size_t>>(selector);
    if (indices.empty()) {
      throw utils::IndexRangeError("Empty index list");
    }
  }

  for (size_t index : indices) {
    if (index >= n) {
      throw utils::IndexRangeError("Index " + std::to_string(index) + " out of range [0, " +
                                   std::to_string(n) + ")");
    }
  }
  return indices;
}

} // namespace data_loading
