/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <stdexcept>
#include <string>

namespace utils {

// Dataset construction

class EmptyClassError : public std::runtime_error {
public:
  explicit EmptyClassError(const std::string &class_name)
      : std::runtime_error("Class '" + class_name + "' has zero samples"),
        class_name_(class_name) {}

  const std::string &class_name() const { return class_name_; }

private:
  std::string class_name_;
};

class EmptyDatasetError : public std::runtime_error {
public:
  explicit EmptyDatasetError(const std::string &what) : std::runtime_error(what) {}
};

class UnsupportedModeError : public std::runtime_error {
public:
  explicit UnsupportedModeError(const std::string &what) : std::runtime_error(what) {}
};

// Gathers and batch assembly

class IndexRangeError : public std::out_of_range {
public:
  explicit IndexRangeError(const std::string &what) : std::out_of_range(what) {}
};

class ShapeMismatchError : public std::invalid_argument {
public:
  explicit ShapeMismatchError(const std::string &what) : std::invalid_argument(what) {}
};

// View contract violations

class LayoutRankMismatchError : public std::invalid_argument {
public:
  explicit LayoutRankMismatchError(const std::string &what) : std::invalid_argument(what) {}
};

class NoBatchAxisError : public std::invalid_argument {
public:
  explicit NoBatchAxisError(const std::string &layout)
      : std::invalid_argument("Provided view '" + layout + "' has no axis 'b'") {}
};

class TypeMismatchError : public std::invalid_argument {
public:
  explicit TypeMismatchError(const std::string &what) : std::invalid_argument(what) {}
};

class UnsupportedLayoutError : public std::invalid_argument {
public:
  explicit UnsupportedLayoutError(const std::string &what) : std::invalid_argument(what) {}
};

class ViewStateError : public std::logic_error {
public:
  explicit ViewStateError(const std::string &what) : std::logic_error(what) {}
};

} // namespace utils
