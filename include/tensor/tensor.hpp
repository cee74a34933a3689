/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <new>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

enum ALIGNMENT_TYPE { CACHE_LINE = 64 };

/**
 * @brief A dynamic-rank, row-major tensor owning an aligned buffer.
 * @tparam T Data type (e.g., float, double, int64_t)
 * The rank is a runtime property so that the same type can hold a (N, C, H, W)
 * image batch, a (N, F) feature matrix or a (N) label vector.
 */
template <typename T = float> struct Tensor {
  static_assert(std::is_arithmetic<T>::value, "Tensor type must be arithmetic");

private:
  std::vector<size_t> shape_;
  std::vector<size_t> strides_;
  T *data_;
  size_t data_size_;

  void compute_strides() {
    strides_.assign(shape_.size(), 1);
    for (size_t i = shape_.size(); i > 1; --i) {
      strides_[i - 2] = strides_[i - 1] * shape_[i - 1];
    }
  }

  template <typename... Indices> inline size_t compute_index(Indices... indices) const {
    size_t index = 0;
    size_t count = 0;
    ((index += static_cast<size_t>(indices) * strides_[count++]), ...);
    return index;
  }

  static T *allocate_aligned(size_t count) {
    if (count == 0)
      return nullptr;

    constexpr size_t alignment = ALIGNMENT_TYPE::CACHE_LINE;
    size_t byte_size = count * sizeof(T);
    size_t aligned_size = ((byte_size + alignment - 1) / alignment) * alignment;

    void *ptr = std::aligned_alloc(alignment, aligned_size);
    if (ptr == nullptr) {
      throw std::bad_alloc();
    }
    return static_cast<T *>(ptr);
  }

  static void deallocate_aligned(T *ptr) {
    if (ptr != nullptr) {
      std::free(ptr);
    }
  }

public:
  Tensor() : data_(nullptr), data_size_(0) {}

  explicit Tensor(std::vector<size_t> shape) : shape_(std::move(shape)), data_(nullptr) {
    compute_strides();
    data_size_ =
        std::accumulate(shape_.begin(), shape_.end(), size_t(1), std::multiplies<size_t>());
    data_ = allocate_aligned(data_size_);
    std::fill(data_, data_ + data_size_, T(0));
  }

  Tensor(std::vector<size_t> shape, const T *data) : shape_(std::move(shape)), data_(nullptr) {
    compute_strides();
    data_size_ =
        std::accumulate(shape_.begin(), shape_.end(), size_t(1), std::multiplies<size_t>());
    data_ = allocate_aligned(data_size_);
    if (data != nullptr) {
      std::copy(data, data + data_size_, data_);
    } else {
      std::fill(data_, data_ + data_size_, T(0));
    }
  }

  Tensor(size_t batch_size, size_t channels, size_t height, size_t width)
      : Tensor(std::vector<size_t>{batch_size, channels, height, width}) {}

  ~Tensor() { deallocate_aligned(data_); }

  Tensor(const Tensor &other)
      : shape_(other.shape_), strides_(other.strides_), data_(nullptr),
        data_size_(other.data_size_) {
    if (data_size_ > 0) {
      data_ = allocate_aligned(data_size_);
      std::copy(other.data_, other.data_ + data_size_, data_);
    }
  }

  Tensor(Tensor &&other) noexcept
      : shape_(std::move(other.shape_)), strides_(std::move(other.strides_)), data_(other.data_),
        data_size_(other.data_size_) {
    other.data_ = nullptr;
    other.data_size_ = 0;
  }

  Tensor<T> &operator=(const Tensor<T> &other) = delete;

  Tensor<T> &operator=(Tensor<T> &&other) noexcept {
    if (this != &other) {
      deallocate_aligned(data_);

      shape_ = std::move(other.shape_);
      strides_ = std::move(other.strides_);
      data_ = other.data_;
      data_size_ = other.data_size_;

      other.data_ = nullptr;
      other.data_size_ = 0;
    }
    return *this;
  }

  template <typename... Indices> T &operator()(Indices... indices) {
    return data_[compute_index(indices...)];
  }

  template <typename... Indices> const T &operator()(Indices... indices) const {
    return data_[compute_index(indices...)];
  }

  bool same_shape(const Tensor<T> &other) const { return shape_ == other.shape_; }

  Tensor<T> &operator+=(const Tensor<T> &other) {
    if (!same_shape(other)) {
      throw std::invalid_argument("Tensor shapes must match for addition: " + shape_str() +
                                  " vs " + other.shape_str());
    }
    for (size_t i = 0; i < data_size_; ++i) {
      data_[i] += other.data_[i];
    }
    return *this;
  }

  const std::vector<size_t> &shape() const { return shape_; }

  const std::vector<size_t> &strides() const { return strides_; }

  std::string shape_str() const {
    std::ostringstream oss;
    oss << "{";
    for (size_t i = 0; i < shape_.size(); ++i) {
      oss << shape_[i];
      if (i < shape_.size() - 1) {
        oss << ", ";
      }
    }
    oss << "}";
    return oss.str();
  }

  size_t dims() const { return shape_.size(); }

  size_t dimension(const size_t index) const { return shape_[index]; }

  size_t stride(const size_t index) const { return strides_[index]; }

  size_t size() const { return data_size_; }

  bool empty() const { return data_size_ == 0; }

  T *data() { return data_; }

  const T *data() const { return data_; }

  Tensor<T> clone() const { return Tensor<T>(shape_, data_); }

  void fill(T value) { std::fill(data_, data_ + data_size_, value); }

  // Reallocates only when the element count changes; contents are undefined afterwards.
  void resize(const std::vector<size_t> &new_shape) {
    size_t new_size =
        std::accumulate(new_shape.begin(), new_shape.end(), size_t(1), std::multiplies<size_t>());
    if (new_size != data_size_) {
      deallocate_aligned(data_);
      data_ = allocate_aligned(new_size);
      data_size_ = new_size;
    }
    shape_ = new_shape;
    compute_strides();
  }

  Tensor<T> reshape(const std::vector<size_t> &new_shape) const {
    size_t new_size =
        std::accumulate(new_shape.begin(), new_shape.end(), size_t(1), std::multiplies<size_t>());
    if (new_size != size()) {
      throw std::invalid_argument("New shape must have same total size, got " +
                                  std::to_string(new_size) + " for " + shape_str());
    }
    return Tensor<T>(new_shape, data_);
  }
};
