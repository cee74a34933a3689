/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "tensor/dtype.hpp"
#include "transform_pipeline.hpp"

namespace tview {

enum class ViewState { Empty, Loaded, Realized, GradientsPending, GradientResolved };

std::string to_string(ViewState state);

/**
 * Exchanges one tensor between a producer and any number of consumers that want
 * it in different layouts and numeric types.
 *
 * Layouts are strings with one character per axis: b (batch), c (channel),
 * h (height), w (width), f (feature), s / t (sequence / time). The producer
 * calls forward_put once per pass with the canonical tensor; consumers call
 * forward_get(layout, dtype) and later backward_put their gradients, which
 * backward_get sums back into the canonical layout.
 *
 * Derived tensors are cached for the current pass; pipelines are cached across
 * passes as long as the canonical layout stays the same.
 */
class View {
public:
  explicit View(CollapseOrder collapse_order = CollapseOrder::Declared)
      : collapse_order_(collapse_order) {}

  View(View &&) = default;
  View &operator=(View &&) = default;

  // Forward

  /**
   * @throws utils::LayoutRankMismatchError if tensor rank != layout length
   * @throws utils::UnsupportedLayoutError if the layout repeats an axis
   */
  void forward_put(const std::string &layout, AnyTensor tensor);

  template <typename T> void forward_put(const std::string &layout, Tensor<T> tensor) {
    forward_put(layout, AnyTensor(std::move(tensor)));
  }

  // The reference stays valid until the next forward_put.
  const AnyTensor &forward_get(const std::string &layout, DType dtype);

  template <typename T> const Tensor<T> &forward_get(const std::string &layout) {
    return std::get<Tensor<T>>(forward_get(layout, dtype_v<T>));
  }

  // Backward

  void backward_put(const std::string &layout, AnyTensor grad);

  template <typename T> void backward_put(const std::string &layout, Tensor<T> grad) {
    backward_put(layout, AnyTensor(std::move(grad)));
  }

  /**
   * Sum of every deposited gradient, in the canonical layout and type.
   * @throws utils::TypeMismatchError if dtype differs from the canonical type
   */
  const AnyTensor &backward_get(DType dtype);

  template <typename T> const Tensor<T> &backward_get() {
    return std::get<Tensor<T>>(backward_get(dtype_v<T>));
  }

  // Batch selection. Indices and ranges are 0-based, ranges inclusive.

  View index_along_batch(const std::vector<size_t> &indices) const;
  View &index_along_batch(const std::vector<size_t> &indices, View &out) const;

  View slice_along_batch(size_t start, size_t stop) const;
  View &slice_along_batch(size_t start, size_t stop, View &out) const;

  // Like slice_along_batch but always refills the same child view.
  View &sub(size_t start, size_t stop);

  // Queries

  const std::string &layout() const { return layout_; }
  DType dtype() const;
  const AnyTensor &canonical() const;
  const std::vector<size_t> &shape() const { return shape_of(canonical()); }

  size_t n_sample() const;
  // Product of every non-batch axis.
  size_t sample_size() const;

  size_t find_axis(char axis) const;
  bool has_axis(char axis) const { return layout_.find(axis) != std::string::npos; }

  ViewState state() const { return state_; }
  CollapseOrder collapse_order() const { return collapse_order_; }

  // nullptr when no pipeline for `layout` was built yet.
  const TransformPipeline *pipeline(const std::string &layout) const;

  size_t num_pending_gradients() const { return gradients_.size(); }

private:
  const AnyTensor &require_canonical(const char *operation) const;

  CollapseOrder collapse_order_;
  ViewState state_ = ViewState::Empty;

  std::string layout_;
  std::unique_ptr<AnyTensor> canonical_;

  std::map<std::pair<std::string, DType>, AnyTensor> tensors_;
  std::map<std::string, TransformPipeline> pipelines_;
  std::vector<std::pair<std::string, AnyTensor>> gradients_;
  std::unique_ptr<AnyTensor> grad_input_;

  std::unique_ptr<View> sub_view_;
};

} // namespace tview
