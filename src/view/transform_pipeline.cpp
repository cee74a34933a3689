/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "view/transform_pipeline.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <type_traits>

#include "tensor/tensor_ops.hpp"
#include "utils/errors.hpp"

namespace tview {

namespace {

std::string shape_to_string(const std::vector<size_t> &shape) {
  std::ostringstream oss;
  oss << "{";
  for (size_t i = 0; i < shape.size(); ++i) {
    oss << shape[i] << (i + 1 < shape.size() ? "," : "");
  }
  oss << "}";
  return oss.str();
}

std::vector<size_t> step_output_shape(const std::vector<size_t> &shape,
                                      const TransformStep &step) {
  if (const auto *permute_step = std::get_if<PermuteStep>(&step)) {
    if (!is_permutation_of_axes(permute_step->axes, shape.size())) {
      throw utils::ShapeMismatchError("Permutation does not match tensor of shape " +
                                      shape_to_string(shape));
    }
    std::vector<size_t> out(shape.size());
    for (size_t i = 0; i < shape.size(); ++i) {
      out[i] = shape[permute_step->axes[i]];
    }
    return out;
  }

  const auto &collapse = std::get<CollapseStep>(step);
  if (collapse.first > collapse.last || collapse.last > shape.size()) {
    throw utils::ShapeMismatchError("Cannot collapse axes [" + std::to_string(collapse.first) +
                                    ", " + std::to_string(collapse.last) + ") of shape " +
                                    shape_to_string(shape));
  }
  std::vector<size_t> out(shape.begin(), shape.begin() + collapse.first);
  out.push_back(std::accumulate(shape.begin() + collapse.first, shape.begin() + collapse.last,
                                size_t(1), std::multiplies<size_t>()));
  out.insert(out.end(), shape.begin() + collapse.last, shape.end());
  return out;
}

template <typename T> Tensor<T> apply_step(const Tensor<T> &input, const TransformStep &step) {
  if (const auto *permute_step = std::get_if<PermuteStep>(&step)) {
    return permute(input, permute_step->axes);
  }
  return input.reshape(step_output_shape(input.shape(), step));
}

template <typename T>
AnyTensor run_steps(const Tensor<T> &input, const std::vector<TransformStep> &steps,
                    DType dtype) {
  if (steps.empty()) {
    return cast(input, dtype);
  }
  Tensor<T> current = apply_step(input, steps.front());
  for (size_t i = 1; i < steps.size(); ++i) {
    current = apply_step(current, steps[i]);
  }
  if (dtype == dtype_v<T>) {
    return AnyTensor(std::move(current));
  }
  return cast(current, dtype);
}

// shapes[i] is the input shape of steps[i]; shapes.back() is the output shape.
template <typename T>
AnyTensor undo_steps(Tensor<T> grad, const std::vector<TransformStep> &steps,
                     const std::vector<std::vector<size_t>> &shapes) {
  for (size_t i = steps.size(); i > 0; --i) {
    const TransformStep &step = steps[i - 1];
    if (const auto *permute_step = std::get_if<PermuteStep>(&step)) {
      grad = permute(grad, inverse_permutation(permute_step->axes));
    } else {
      grad = grad.reshape(shapes[i - 1]);
    }
  }
  return AnyTensor(std::move(grad));
}

} // namespace

std::vector<size_t> TransformPipeline::output_shape(const std::vector<size_t> &input_shape) const {
  std::vector<size_t> shape = input_shape;
  for (const auto &step : steps_) {
    shape = step_output_shape(shape, step);
  }
  return shape;
}

AnyTensor TransformPipeline::forward(const AnyTensor &input, DType dtype) {
  ++run_count_;
  return std::visit([&](const auto &tensor) { return run_steps(tensor, steps_, dtype); }, input);
}

AnyTensor TransformPipeline::backward(const AnyTensor &grad,
                                      const std::vector<size_t> &canonical_shape,
                                      DType canonical_dtype) const {
  std::vector<std::vector<size_t>> shapes{canonical_shape};
  for (const auto &step : steps_) {
    shapes.push_back(step_output_shape(shapes.back(), step));
  }
  if (shape_of(grad) != shapes.back()) {
    throw utils::ShapeMismatchError("Gradient of shape " + shape_to_string(shape_of(grad)) +
                                    " does not match forwarded shape " +
                                    shape_to_string(shapes.back()));
  }

  AnyTensor typed = cast(grad, canonical_dtype);
  return std::visit(
      [&](auto &tensor) { return undo_steps(std::move(tensor), steps_, shapes); }, typed);
}

std::string TransformPipeline::describe() const {
  if (steps_.empty()) {
    return "identity";
  }
  std::ostringstream oss;
  for (size_t i = 0; i < steps_.size(); ++i) {
    if (i > 0) {
      oss << " -> ";
    }
    if (const auto *permute_step = std::get_if<PermuteStep>(&steps_[i])) {
      oss << "permute" << shape_to_string(permute_step->axes);
    } else {
      const auto &collapse = std::get<CollapseStep>(steps_[i]);
      oss << "collapse[" << collapse.first << "," << collapse.last << ")";
    }
  }
  return oss.str();
}

void validate_layout(const std::string &layout) {
  if (layout.empty()) {
    throw utils::UnsupportedLayoutError("View layout must not be empty");
  }
  std::string sorted = layout;
  std::sort(sorted.begin(), sorted.end());
  if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
    throw utils::UnsupportedLayoutError("View '" + layout + "' repeats an axis");
  }
}

TransformPipeline build_pipeline(const std::string &canonical, const std::string &target,
                                 CollapseOrder order) {
  validate_layout(canonical);
  validate_layout(target);

  if (target == canonical) {
    return TransformPipeline();
  }

  if (std::is_permutation(target.begin(), target.end(), canonical.begin(), canonical.end())) {
    std::vector<size_t> axes(target.size());
    for (size_t i = 0; i < target.size(); ++i) {
      axes[i] = canonical.find(target[i]);
    }
    return TransformPipeline(std::vector<TransformStep>{PermuteStep{axes}});
  }

  if (target == "bf" || target == "fb") {
    const size_t b_pos = canonical.find('b');
    if (b_pos == std::string::npos) {
      throw utils::NoBatchAxisError(canonical);
    }
    const bool batch_first = target == "bf";
    const size_t rank = canonical.size();

    // a lone batch axis gets a unit feature axis
    if (rank == 1) {
      const size_t at = batch_first ? 1 : 0;
      return TransformPipeline(std::vector<TransformStep>{CollapseStep{at, at}});
    }

    std::vector<TransformStep> steps;
    const size_t dest = batch_first ? 0 : rank - 1;
    if (b_pos != dest) {
      std::vector<size_t> axes(rank);
      std::iota(axes.begin(), axes.end(), size_t(0));
      if (order == CollapseOrder::Swapped) {
        std::swap(axes[b_pos], axes[dest]);
      } else {
        axes.erase(axes.begin() + b_pos);
        axes.insert(batch_first ? axes.begin() : axes.end(), b_pos);
      }
      steps.push_back(PermuteStep{axes});
    }
    if (rank > 2) {
      steps.push_back(batch_first ? CollapseStep{1, rank} : CollapseStep{0, rank - 1});
    }
    return TransformPipeline(std::move(steps));
  }

  throw utils::UnsupportedLayoutError("No transform from view '" + canonical + "' to '" +
                                      target + "'");
}

} // namespace tview
