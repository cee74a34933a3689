/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <string>
#include <variant>
#include <vector>

#include "tensor/dtype.hpp"

namespace tview {

// Output axis i is input axis axes[i].
struct PermuteStep {
  std::vector<size_t> axes;
};

/**
 * Collapses the axes [first, last) into one axis holding their product. An
 * empty range inserts a unit axis at `first`. The step stores axis positions
 * only, so one pipeline serves any batch size.
 */
struct CollapseStep {
  size_t first;
  size_t last;
};

using TransformStep = std::variant<PermuteStep, CollapseStep>;

/**
 * How "bf" / "fb" order the non-batch axes before collapsing them.
 *   Declared: remaining axes keep their order in the canonical layout.
 *   Swapped:  the batch axis trades places with the first (or last) axis, so a
 *             "chwb" view collapses as h, w, c.
 */
enum class CollapseOrder { Declared, Swapped };

/**
 * Converts a canonical tensor into one derived layout and maps gradients of
 * that layout back. Built once per (canonical layout, target layout) and reused
 * across passes.
 */
class TransformPipeline {
public:
  TransformPipeline() = default;
  explicit TransformPipeline(std::vector<TransformStep> steps) : steps_(std::move(steps)) {}

  const std::vector<TransformStep> &steps() const { return steps_; }
  bool is_identity() const { return steps_.empty(); }

  std::vector<size_t> output_shape(const std::vector<size_t> &input_shape) const;

  // Applies the steps then casts to `dtype`. Always returns a fresh tensor.
  AnyTensor forward(const AnyTensor &input, DType dtype);

  /**
   * Casts `grad` to the canonical type and undoes the steps in reverse order.
   * @throws utils::ShapeMismatchError if grad does not have the forward output shape
   */
  AnyTensor backward(const AnyTensor &grad, const std::vector<size_t> &canonical_shape,
                     DType canonical_dtype) const;

  // Number of forward runs so far.
  size_t run_count() const { return run_count_; }

  std::string describe() const;

private:
  std::vector<TransformStep> steps_;
  size_t run_count_ = 0;
};

/**
 * Throws utils::UnsupportedLayoutError unless every character of `layout` is
 * distinct and the layout is not empty.
 */
void validate_layout(const std::string &layout);

/**
 * Builds the pipeline turning a `canonical` tensor into `target`:
 * identity, a pure axis permutation, or the "bf" / "fb" batch-feature flattening.
 * @throws utils::NoBatchAxisError for "bf" / "fb" when canonical has no 'b'
 * @throws utils::UnsupportedLayoutError for any other target
 */
TransformPipeline build_pipeline(const std::string &canonical, const std::string &target,
                                 CollapseOrder order = CollapseOrder::Declared);

} // namespace tview
