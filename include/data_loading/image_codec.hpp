/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstddef>
#include <string>

#include "tensor/tensor.hpp"

namespace data_loading {

/**
 * Decodes image files into (channels, height, width) float tensors.
 * Implementations must be safe to call from several threads at once; batch
 * assembly decodes the samples of one batch in parallel.
 */
class ImageCodec {
public:
  virtual ~ImageCodec() = default;

  /**
   * Decode `path` and resize it to height x width.
   * @throws std::runtime_error if the file cannot be decoded
   */
  virtual Tensor<float> decode(const std::string &path, size_t height, size_t width) const = 0;

  // Resize an already decoded (channels, height, width) sample.
  virtual Tensor<float> resize(const Tensor<float> &image, size_t height, size_t width) const = 0;

  virtual size_t channels() const = 0;
};

/**
 * OpenCV backed codec. Produces RGB (or single channel grayscale) pixels scaled to
 * [0, 1], channel-major.
 */
class OpenCVImageCodec : public ImageCodec {
public:
  explicit OpenCVImageCodec(size_t channels = 3);

  Tensor<float> decode(const std::string &path, size_t height, size_t width) const override;
  Tensor<float> resize(const Tensor<float> &image, size_t height, size_t width) const override;
  size_t channels() const override { return channels_; }

private:
  size_t channels_;
};

} // namespace data_loading
