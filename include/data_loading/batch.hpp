/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "carry.hpp"
#include "tensor/tensor.hpp"

namespace data_loading {

// Value of the multi-hot label tensor outside the true class column.
constexpr int64_t MULTI_HOT_BACKGROUND = -1;
constexpr int64_t MULTI_HOT_TARGET = 1;

/**
 * One batch of decoded samples.
 *   inputs    (N, C, H, W) pixels
 *   labels    (N) class ids
 *   multi_hot (N, num_classes), MULTI_HOT_BACKGROUND everywhere except
 *             MULTI_HOT_TARGET at the true class column
 */
struct Batch {
  std::string which_set;
  size_t epoch_size = 0;
  Tensor<float> inputs;
  Tensor<int64_t> labels;
  Tensor<int64_t> multi_hot;
  std::unique_ptr<Carry> carry;

  size_t size() const { return labels.dims() == 0 ? 0 : labels.dimension(0); }
};

} // namespace data_loading
