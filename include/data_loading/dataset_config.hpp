/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace data_loading {

// Separator of the DATA_PATHS list, as in PATH.
#ifdef _WIN32
constexpr char PATH_LIST_SEPARATOR = ';';
#else
constexpr char PATH_LIST_SEPARATOR = ':';
#endif

enum class SamplingMode { Balanced, Random };

std::string to_string(SamplingMode mode);
SamplingMode parse_sampling_mode(const std::string &name);

// Validates "train", "valid" or "test".
std::string parse_which_set(const std::string &name);

struct ImageShape {
  size_t channels = 3;
  size_t height = 0;
  size_t width = 0;

  bool operator==(const ImageShape &other) const {
    return channels == other.channels && height == other.height && width == other.width;
  }
  bool operator!=(const ImageShape &other) const { return !(*this == other); }

  std::vector<size_t> to_vector() const { return {channels, height, width}; }
  static ImageShape from_vector(const std::vector<size_t> &dims);
  std::string to_string() const;
};

struct DatasetConfig {
  std::vector<std::string> data_paths;
  ImageShape load_size;
  std::optional<ImageShape> sample_size;
  std::string which_set = "train";
  SamplingMode sampling_mode = SamplingMode::Balanced;
  bool verbose = true;
  std::optional<uint32_t> seed;

  ImageShape effective_sample_size() const { return sample_size ? *sample_size : load_size; }

  // Throws std::invalid_argument / utils::UnsupportedModeError on bad fields.
  void validate() const;

  nlohmann::json to_json() const;
  static DatasetConfig from_json(const nlohmann::json &j);

  static DatasetConfig load_from_file(const std::string &path);

  /**
   * Overrides fields from DATA_PATHS (PATH_LIST_SEPARATOR-separated), LOAD_SIZE and SAMPLE_SIZE
   * ("c,h,w"), WHICH_SET, SAMPLING_MODE, VERBOSE and SEED when they are set.
   */
  void load_from_env();

  void print_config() const;
};

} // namespace data_loading
