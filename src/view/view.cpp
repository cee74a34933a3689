/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "view/view.hpp"

#include <type_traits>

#include "tensor/tensor_ops.hpp"
#include "utils/errors.hpp"

namespace tview {

namespace {

void add_into(AnyTensor &accumulator, const AnyTensor &grad) {
  std::visit(
      [](auto &acc, const auto &g) {
        using Acc = std::decay_t<decltype(acc)>;
        using G = std::decay_t<decltype(g)>;
        if constexpr (std::is_same<Acc, G>::value) {
          acc += g;
        } else {
          throw utils::TypeMismatchError("Cannot accumulate gradients of different types");
        }
      },
      accumulator, grad);
}

} // namespace

std::string to_string(ViewState state) {
  switch (state) {
  case ViewState::Empty:
    return "empty";
  case ViewState::Loaded:
    return "loaded";
  case ViewState::Realized:
    return "realized";
  case ViewState::GradientsPending:
    return "gradients_pending";
  case ViewState::GradientResolved:
    return "gradient_resolved";
  }
  return "unknown";
}

void View::forward_put(const std::string &layout, AnyTensor tensor) {
  validate_layout(layout);
  const size_t rank = shape_of(tensor).size();
  if (rank != layout.size()) {
    throw utils::LayoutRankMismatchError("View '" + layout + "' has " +
                                         std::to_string(layout.size()) +
                                         " axes but the tensor has " + std::to_string(rank) +
                                         " dimensions");
  }

  // pipelines are relative to the canonical layout
  if (layout != layout_) {
    pipelines_.clear();
  }
  layout_ = layout;
  canonical_ = std::make_unique<AnyTensor>(std::move(tensor));
  tensors_.clear();
  gradients_.clear();
  grad_input_.reset();
  state_ = ViewState::Loaded;
}

const AnyTensor &View::forward_get(const std::string &layout, DType dtype) {
  const AnyTensor &input = require_canonical("forward_get");

  const auto key = std::make_pair(layout, dtype);
  auto cached = tensors_.find(key);
  if (cached != tensors_.end()) {
    return cached->second;
  }

  auto it = pipelines_.find(layout);
  if (it == pipelines_.end()) {
    it = pipelines_.emplace(layout, build_pipeline(layout_, layout, collapse_order_)).first;
  }

  auto inserted = tensors_.emplace(key, it->second.forward(input, dtype)).first;
  if (state_ == ViewState::Loaded) {
    state_ = ViewState::Realized;
  }
  return inserted->second;
}

void View::backward_put(const std::string &layout, AnyTensor grad) {
  const AnyTensor &input = require_canonical("backward_put");
  const auto it = pipelines_.find(layout);
  if (it == pipelines_.end()) {
    throw utils::ViewStateError("backward_put('" + layout + "') must follow a forward_get of " +
                                "that view");
  }
  if (it->second.output_shape(shape_of(input)) != shape_of(grad)) {
    throw utils::ShapeMismatchError("Gradient for view '" + layout +
                                    "' does not have the forwarded shape");
  }
  gradients_.emplace_back(layout, std::move(grad));
  state_ = ViewState::GradientsPending;
}

const AnyTensor &View::backward_get(DType dtype) {
  const AnyTensor &input = require_canonical("backward_get");
  if (dtype != dtype_of(input)) {
    throw utils::TypeMismatchError("backward_get should be called with the canonical type " +
                                   dtype_name(dtype_of(input)) + ", got " + dtype_name(dtype));
  }
  if (gradients_.empty()) {
    throw utils::ViewStateError("backward_get called without any backward_put");
  }

  const std::vector<size_t> &canonical_shape = shape_of(input);

  // one-to-one backward
  if (gradients_.size() == 1) {
    const auto &[layout, grad] = gradients_.front();
    grad_input_ = std::make_unique<AnyTensor>(
        pipelines_.at(layout).backward(grad, canonical_shape, dtype));
  } else {
    auto accumulator = std::make_unique<AnyTensor>(zeros(canonical_shape, dtype));
    for (const auto &[layout, grad] : gradients_) {
      add_into(*accumulator, pipelines_.at(layout).backward(grad, canonical_shape, dtype));
    }
    grad_input_ = std::move(accumulator);
  }
  state_ = ViewState::GradientResolved;
  return *grad_input_;
}

View View::index_along_batch(const std::vector<size_t> &indices) const {
  View out(collapse_order_);
  index_along_batch(indices, out);
  return out;
}

View &View::index_along_batch(const std::vector<size_t> &indices, View &out) const {
  const AnyTensor &input = require_canonical("index_along_batch");
  const size_t b_pos = find_axis('b');
  const size_t count = shape_of(input)[b_pos];
  for (size_t index : indices) {
    if (index >= count) {
      throw utils::IndexRangeError("Index " + std::to_string(index) + " out of range [0, " +
                                   std::to_string(count) + ")");
    }
  }
  if (!out.layout_.empty() && out.layout_ != layout_) {
    throw utils::LayoutRankMismatchError("Expecting a view of '" + layout_ + "', got '" +
                                         out.layout_ + "'");
  }
  out.forward_put(layout_, std::visit(
                               [&](const auto &t) -> AnyTensor {
                                 return index_select(t, b_pos, indices);
                               },
                               input));
  return out;
}

View View::slice_along_batch(size_t start, size_t stop) const {
  View out(collapse_order_);
  slice_along_batch(start, stop, out);
  return out;
}

View &View::slice_along_batch(size_t start, size_t stop, View &out) const {
  const AnyTensor &input = require_canonical("slice_along_batch");
  const size_t b_pos = find_axis('b');
  const size_t count = shape_of(input)[b_pos];
  if (start > stop || stop >= count) {
    throw utils::IndexRangeError("Slice [" + std::to_string(start) + ", " +
                                 std::to_string(stop) + "] out of range [0, " +
                                 std::to_string(count) + ")");
  }
  if (!out.layout_.empty() && out.layout_ != layout_) {
    throw utils::LayoutRankMismatchError("Expecting a view of '" + layout_ + "', got '" +
                                         out.layout_ + "'");
  }
  out.forward_put(layout_, std::visit(
                               [&](const auto &t) -> AnyTensor {
                                 return narrow(t, b_pos, start, stop - start + 1);
                               },
                               input));
  return out;
}

View &View::sub(size_t start, size_t stop) {
  if (!sub_view_) {
    sub_view_ = std::make_unique<View>(collapse_order_);
  }
  return slice_along_batch(start, stop, *sub_view_);
}

DType View::dtype() const { return dtype_of(require_canonical("dtype")); }

const AnyTensor &View::canonical() const { return require_canonical("canonical"); }

size_t View::n_sample() const { return shape()[find_axis('b')]; }

size_t View::sample_size() const {
  const size_t b_pos = find_axis('b');
  const std::vector<size_t> &dims = shape();
  size_t size = 1;
  for (size_t i = 0; i < dims.size(); ++i) {
    if (i != b_pos) {
      size *= dims[i];
    }
  }
  return size;
}

size_t View::find_axis(char axis) const {
  const size_t pos = layout_.find(axis);
  if (pos == std::string::npos) {
    if (axis == 'b') {
      throw utils::NoBatchAxisError(layout_);
    }
    throw utils::UnsupportedLayoutError("Provided view '" + layout_ + "' has no axis '" +
                                        std::string(1, axis) + "'");
  }
  return pos;
}

const TransformPipeline *View::pipeline(const std::string &layout) const {
  const auto it = pipelines_.find(layout);
  return it == pipelines_.end() ? nullptr : &it->second;
}

const AnyTensor &View::require_canonical(const char *operation) const {
  if (!canonical_) {
    throw utils::ViewStateError(std::string(operation) + " called before forward_put");
  }
  return *canonical_;
}

} // namespace tview
