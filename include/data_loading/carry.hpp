/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace data_loading {

/**
 * Opaque per-sample bookkeeping that travels with a batch. The dataset only
 * narrows it alongside the inputs and never looks inside.
 */
class Carry {
public:
  virtual ~Carry() = default;

  // Samples [start, stop], inclusive.
  virtual std::unique_ptr<Carry> slice(size_t start, size_t stop) const = 0;

  virtual std::unique_ptr<Carry> gather(const std::vector<size_t> &indices) const = 0;
};

class EmptyCarry : public Carry {
public:
  std::unique_ptr<Carry> slice(size_t, size_t) const override {
    return std::make_unique<EmptyCarry>();
  }

  std::unique_ptr<Carry> gather(const std::vector<size_t> &) const override {
    return std::make_unique<EmptyCarry>();
  }
};

} // namespace data_loading
