/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <random>
#include <string>
#include <vector>

#include "batch.hpp"
#include "index_selector.hpp"

namespace data_loading {

/**
 * Abstract base class for image classification datasets
 * Provides the common sampling / gathering interface used by the training loop
 */
class DataSet {
public:
  virtual ~DataSet() = default;

  /**
   * Draw `quantity` training samples according to the dataset's sampling mode
   */
  virtual Batch sample(size_t quantity) = 0;

  /**
   * Deterministically gather the selected samples, in selection order
   */
  virtual Batch get(const IndexSelector &selector) const = 0;

  /**
   * Get the total number of samples in the dataset
   */
  virtual size_t size() const = 0;

  /**
   * Get sample dimensions (channels, height, width)
   */
  virtual std::vector<size_t> get_image_shape() const = 0;

  virtual size_t get_num_classes() const = 0;

  virtual std::vector<std::string> get_class_names() const = 0;

  const std::string &which_set() const { return which_set_; }

  /**
   * Set random seed for reproducible sampling
   */
  virtual void set_seed(unsigned int seed) { rng_.seed(seed); }

  std::mt19937 &get_rng() { return rng_; }

protected:
  std::string which_set_ = "train";
  std::mt19937 rng_{std::random_device{}()};
};

} // namespace data_loading
