/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "tensor.hpp"
#include "utils/parallel_for.hpp"

inline bool is_permutation_of_axes(const std::vector<size_t> &axes, size_t rank) {
  if (axes.size() != rank)
    return false;
  std::vector<bool> seen(rank, false);
  for (size_t axis : axes) {
    if (axis >= rank || seen[axis])
      return false;
    seen[axis] = true;
  }
  return true;
}

inline std::vector<size_t> inverse_permutation(const std::vector<size_t> &axes) {
  std::vector<size_t> inverse(axes.size());
  for (size_t i = 0; i < axes.size(); ++i) {
    inverse[axes[i]] = i;
  }
  return inverse;
}

/**
 * Returns a contiguous tensor whose axis i is axis axes[i] of the input.
 */
template <typename T> Tensor<T> permute(const Tensor<T> &input, const std::vector<size_t> &axes) {
  const size_t rank = input.dims();
  if (!is_permutation_of_axes(axes, rank)) {
    throw std::invalid_argument("Invalid permutation for tensor of shape " + input.shape_str());
  }

  std::vector<size_t> out_shape(rank);
  std::vector<size_t> src_strides(rank);
  for (size_t i = 0; i < rank; ++i) {
    out_shape[i] = input.dimension(axes[i]);
    src_strides[i] = input.stride(axes[i]);
  }

  Tensor<T> result(out_shape, nullptr);
  if (result.size() == 0)
    return result;

  const T *src = input.data();
  T *dst = result.data();
  const size_t outer = out_shape[0];
  const size_t inner = result.size() / outer;

  utils::parallel_for<size_t>(0, outer, [&](size_t o) {
    std::vector<size_t> counter(rank, 0);
    counter[0] = o;
    size_t src_offset = o * src_strides[0];
    T *out = dst + o * inner;
    for (size_t n = 0; n < inner; ++n) {
      out[n] = src[src_offset];
      // advance the multi-index over axes 1..rank-1, last axis fastest
      for (size_t axis = rank - 1; axis >= 1; --axis) {
        ++counter[axis];
        src_offset += src_strides[axis];
        if (counter[axis] < out_shape[axis])
          break;
        src_offset -= counter[axis] * src_strides[axis];
        counter[axis] = 0;
      }
    }
  });

  return result;
}

/**
 * Returns the `length` slices starting at `start` along `axis`.
 */
template <typename T>
Tensor<T> narrow(const Tensor<T> &input, size_t axis, size_t start, size_t length) {
  if (axis >= input.dims()) {
    throw std::invalid_argument("Axis " + std::to_string(axis) + " out of range for shape " +
                                input.shape_str());
  }
  if (start + length > input.dimension(axis)) {
    throw std::out_of_range("Narrow [" + std::to_string(start) + ", " +
                            std::to_string(start + length) + ") exceeds axis " +
                            std::to_string(axis) + " of shape " + input.shape_str());
  }

  std::vector<size_t> out_shape = input.shape();
  out_shape[axis] = length;
  Tensor<T> result(out_shape, nullptr);

  size_t outer = 1;
  for (size_t i = 0; i < axis; ++i)
    outer *= input.dimension(i);
  const size_t block = input.stride(axis);
  const size_t src_span = input.dimension(axis) * block;
  const size_t dst_span = length * block;

  const T *src = input.data();
  T *dst = result.data();
  for (size_t o = 0; o < outer; ++o) {
    std::copy(src + o * src_span + start * block, src + o * src_span + (start + length) * block,
              dst + o * dst_span);
  }
  return result;
}

/**
 * Gathers the slices listed in `indices` along `axis`, in that order.
 */
template <typename T>
Tensor<T> index_select(const Tensor<T> &input, size_t axis, const std::vector<size_t> &indices) {
  if (axis >= input.dims()) {
    throw std::invalid_argument("Axis " + std::to_string(axis) + " out of range for shape " +
                                input.shape_str());
  }
  const size_t axis_size = input.dimension(axis);
  for (size_t index : indices) {
    if (index >= axis_size) {
      throw std::out_of_range("Index " + std::to_string(index) + " out of range for axis " +
                              std::to_string(axis) + " of shape " + input.shape_str());
    }
  }

  std::vector<size_t> out_shape = input.shape();
  out_shape[axis] = indices.size();
  Tensor<T> result(out_shape, nullptr);

  size_t outer = 1;
  for (size_t i = 0; i < axis; ++i)
    outer *= input.dimension(i);
  const size_t block = input.stride(axis);
  const size_t src_span = axis_size * block;
  const size_t dst_span = indices.size() * block;

  const T *src = input.data();
  T *dst = result.data();
  for (size_t o = 0; o < outer; ++o) {
    for (size_t k = 0; k < indices.size(); ++k) {
      std::copy(src + o * src_span + indices[k] * block,
                src + o * src_span + (indices[k] + 1) * block, dst + o * dst_span + k * block);
    }
  }
  return result;
}
