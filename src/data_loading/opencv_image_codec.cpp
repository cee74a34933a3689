/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "data_loading/image_codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace data_loading {

namespace {

int interpolation_for(int src_rows, int src_cols, size_t height, size_t width) {
  // area averaging when shrinking both axes, bilinear otherwise
  if (static_cast<size_t>(src_rows) > height && static_cast<size_t>(src_cols) > width) {
    return cv::INTER_AREA;
  }
  return cv::INTER_LINEAR;
}

} // namespace

OpenCVImageCodec::OpenCVImageCodec(size_t channels) : channels_(channels) {
  if (channels != 1 && channels != 3) {
    throw std::invalid_argument("OpenCVImageCodec supports 1 or 3 channels, got " +
                                std::to_string(channels));
  }
}

Tensor<float> OpenCVImageCodec::decode(const std::string &path, size_t height,
                                       size_t width) const {
  const int flags = channels_ == 1 ? cv::IMREAD_GRAYSCALE : cv::IMREAD_COLOR;
  cv::Mat image = cv::imread(path, flags);
  if (image.empty()) {
    throw std::runtime_error("Failed to decode image: " + path);
  }
  if (channels_ == 3) {
    cv::cvtColor(image, image, cv::COLOR_BGR2RGB);
  }

  if (static_cast<size_t>(image.rows) != height || static_cast<size_t>(image.cols) != width) {
    cv::Mat resized;
    cv::resize(image, resized, cv::Size(static_cast<int>(width), static_cast<int>(height)), 0, 0,
               interpolation_for(image.rows, image.cols, height, width));
    image = resized;
  }

  cv::Mat pixels;
  image.convertTo(pixels, CV_32F, 1.0 / 255.0);

  Tensor<float> result(std::vector<size_t>{channels_, height, width});
  std::vector<cv::Mat> planes;
  cv::split(pixels, planes);
  const size_t plane_size = height * width;
  for (size_t c = 0; c < channels_; ++c) {
    const cv::Mat plane = planes[c].isContinuous() ? planes[c] : planes[c].clone();
    const float *src = plane.ptr<float>(0);
    std::copy(src, src + plane_size, result.data() + c * plane_size);
  }
  return result;
}

Tensor<float> OpenCVImageCodec::resize(const Tensor<float> &image, size_t height,
                                       size_t width) const {
  if (image.dims() != 3) {
    throw std::invalid_argument("Expected a (channels, height, width) image, got " +
                                image.shape_str());
  }
  const size_t channels = image.dimension(0);
  const int src_rows = static_cast<int>(image.dimension(1));
  const int src_cols = static_cast<int>(image.dimension(2));
  if (image.dimension(1) == height && image.dimension(2) == width) {
    return image.clone();
  }

  Tensor<float> result(std::vector<size_t>{channels, height, width});
  const int interpolation = interpolation_for(src_rows, src_cols, height, width);
  for (size_t c = 0; c < channels; ++c) {
    const cv::Mat src(src_rows, src_cols, CV_32F,
                      const_cast<float *>(image.data() + c * src_rows * src_cols));
    cv::Mat dst(static_cast<int>(height), static_cast<int>(width), CV_32F,
                result.data() + c * height * width);
    cv::resize(src, dst, dst.size(), 0, 0, interpolation);
  }
  return result;
}

} // namespace data_loading
