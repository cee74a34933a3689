/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "tensor.hpp"

enum class DType { Float32, Float64, Int32, Int64, UInt8 };

template <typename T> struct DTypeOf;
template <> struct DTypeOf<float> { static constexpr DType value = DType::Float32; };
template <> struct DTypeOf<double> { static constexpr DType value = DType::Float64; };
template <> struct DTypeOf<int32_t> { static constexpr DType value = DType::Int32; };
template <> struct DTypeOf<int64_t> { static constexpr DType value = DType::Int64; };
template <> struct DTypeOf<uint8_t> { static constexpr DType value = DType::UInt8; };

template <typename T> constexpr DType dtype_v = DTypeOf<T>::value;

/**
 * A tensor of any of the supported element types. The alternative order matches
 * the DType enumerators.
 */
using AnyTensor =
    std::variant<Tensor<float>, Tensor<double>, Tensor<int32_t>, Tensor<int64_t>, Tensor<uint8_t>>;

inline std::string dtype_name(DType dtype) {
  switch (dtype) {
  case DType::Float32:
    return "float32";
  case DType::Float64:
    return "float64";
  case DType::Int32:
    return "int32";
  case DType::Int64:
    return "int64";
  case DType::UInt8:
    return "uint8";
  }
  return "unknown";
}

inline DType parse_dtype(const std::string &name) {
  if (name == "float32" || name == "float")
    return DType::Float32;
  if (name == "float64" || name == "double")
    return DType::Float64;
  if (name == "int32" || name == "int")
    return DType::Int32;
  if (name == "int64" || name == "long")
    return DType::Int64;
  if (name == "uint8" || name == "byte")
    return DType::UInt8;
  throw std::invalid_argument("Unknown tensor type: " + name);
}

inline DType dtype_of(const AnyTensor &tensor) { return static_cast<DType>(tensor.index()); }

inline const std::vector<size_t> &shape_of(const AnyTensor &tensor) {
  return std::visit([](const auto &t) -> const std::vector<size_t> & { return t.shape(); },
                    tensor);
}

template <typename To, typename From> Tensor<To> tensor_cast(const Tensor<From> &input) {
  if constexpr (std::is_same<To, From>::value) {
    return input.clone();
  } else {
    Tensor<To> result(input.shape(), nullptr);
    const From *src = input.data();
    To *dst = result.data();
    for (size_t i = 0; i < input.size(); ++i) {
      dst[i] = static_cast<To>(src[i]);
    }
    return result;
  }
}

template <typename To> Tensor<To> tensor_cast(const AnyTensor &input) {
  return std::visit([](const auto &t) { return tensor_cast<To>(t); }, input);
}

template <typename From> AnyTensor cast(const Tensor<From> &input, DType dtype) {
  switch (dtype) {
  case DType::Float32:
    return tensor_cast<float>(input);
  case DType::Float64:
    return tensor_cast<double>(input);
  case DType::Int32:
    return tensor_cast<int32_t>(input);
  case DType::Int64:
    return tensor_cast<int64_t>(input);
  case DType::UInt8:
    return tensor_cast<uint8_t>(input);
  }
  throw std::invalid_argument("Unknown tensor type");
}

inline AnyTensor cast(const AnyTensor &input, DType dtype) {
  return std::visit([dtype](const auto &t) { return cast(t, dtype); }, input);
}

// Zero-filled tensor of the given shape and type.
inline AnyTensor zeros(const std::vector<size_t> &shape, DType dtype) {
  return cast(Tensor<uint8_t>(shape), dtype);
}

inline AnyTensor clone(const AnyTensor &input) {
  return std::visit([](const auto &t) -> AnyTensor { return t.clone(); }, input);
}
