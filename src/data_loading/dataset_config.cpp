/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "data_loading/dataset_config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "utils/env.hpp"
#include "utils/errors.hpp"

namespace data_loading {

namespace {

std::vector<std::string> split(const std::string &s, char delimiter) {
  std::vector<std::string> parts;
  std::stringstream ss(s);
  std::string part;
  while (std::getline(ss, part, delimiter)) {
    if (!part.empty())
      parts.push_back(part);
  }
  return parts;
}

ImageShape parse_shape(const std::string &s) {
  std::vector<size_t> dims;
  for (const auto &part : split(s, ',')) {
    dims.push_back(static_cast<size_t>(std::stoul(part)));
  }
  return ImageShape::from_vector(dims);
}

} // namespace

std::string to_string(SamplingMode mode) {
  switch (mode) {
  case SamplingMode::Balanced:
    return "balanced";
  case SamplingMode::Random:
    return "random";
  }
  return "unknown";
}

SamplingMode parse_sampling_mode(const std::string &name) {
  if (name == "balanced")
    return SamplingMode::Balanced;
  if (name == "random")
    return SamplingMode::Random;
  throw utils::UnsupportedModeError("Unknown sampling mode '" + name +
                                    "', expected random | balanced");
}

std::string parse_which_set(const std::string &name) {
  if (name == "train" || name == "valid" || name == "test")
    return name;
  throw utils::UnsupportedModeError("Unknown set '" + name + "', expected train | valid | test");
}

ImageShape ImageShape::from_vector(const std::vector<size_t> &dims) {
  if (dims.size() != 3) {
    throw std::invalid_argument("Image size must be {channels, height, width}, got " +
                                std::to_string(dims.size()) + " values");
  }
  return ImageShape{dims[0], dims[1], dims[2]};
}

std::string ImageShape::to_string() const {
  return std::to_string(channels) + "x" + std::to_string(height) + "x" + std::to_string(width);
}

void DatasetConfig::validate() const {
  if (data_paths.empty()) {
    throw std::invalid_argument("DatasetConfig requires at least one data path");
  }
  const ImageShape sample = effective_sample_size();
  if (load_size.channels == 0 || load_size.height == 0 || load_size.width == 0) {
    throw std::invalid_argument("Invalid load size " + load_size.to_string());
  }
  if (sample.channels == 0 || sample.height == 0 || sample.width == 0) {
    throw std::invalid_argument("Invalid sample size " + sample.to_string());
  }
  if (sample.channels != load_size.channels) {
    throw std::invalid_argument("Sample size " + sample.to_string() +
                                " must keep the channel count of load size " +
                                load_size.to_string());
  }
  parse_which_set(which_set);
}

nlohmann::json DatasetConfig::to_json() const {
  nlohmann::json j{{"data_paths", data_paths},
                   {"load_size", load_size.to_vector()},
                   {"which_set", which_set},
                   {"sampling_mode", to_string(sampling_mode)},
                   {"verbose", verbose}};
  if (sample_size) {
    j["sample_size"] = sample_size->to_vector();
  }
  if (seed) {
    j["seed"] = *seed;
  }
  return j;
}

DatasetConfig DatasetConfig::from_json(const nlohmann::json &j) {
  DatasetConfig config;
  const auto &paths = j.at("data_paths");
  if (paths.is_string()) {
    config.data_paths = {paths.get<std::string>()};
  } else {
    config.data_paths = paths.get<std::vector<std::string>>();
  }
  config.load_size = ImageShape::from_vector(j.at("load_size").get<std::vector<size_t>>());
  if (j.contains("sample_size") && !j["sample_size"].is_null()) {
    config.sample_size = ImageShape::from_vector(j["sample_size"].get<std::vector<size_t>>());
  }
  config.which_set = parse_which_set(j.value("which_set", std::string("train")));
  config.sampling_mode = parse_sampling_mode(j.value("sampling_mode", std::string("balanced")));
  config.verbose = j.value("verbose", true);
  if (j.contains("seed") && !j["seed"].is_null()) {
    config.seed = j["seed"].get<uint32_t>();
  }
  return config;
}

DatasetConfig DatasetConfig::load_from_file(const std::string &path) {
  std::ifstream config_file(path);
  if (!config_file.is_open()) {
    throw std::runtime_error("Could not open dataset config file: " + path);
  }
  nlohmann::json config_json;
  try {
    config_file >> config_json;
    return from_json(config_json);
  } catch (const nlohmann::json::exception &e) {
    throw std::runtime_error("Invalid dataset config file " + path + ": " + e.what());
  }
}

void DatasetConfig::load_from_env() {
  if (utils::has_env("DATA_PATHS")) {
    data_paths = split(utils::get_env("DATA_PATHS", std::string()), PATH_LIST_SEPARATOR);
  }
  if (utils::has_env("LOAD_SIZE")) {
    load_size = parse_shape(utils::get_env("LOAD_SIZE", std::string()));
  }
  if (utils::has_env("SAMPLE_SIZE")) {
    sample_size = parse_shape(utils::get_env("SAMPLE_SIZE", std::string()));
  }
  which_set = parse_which_set(utils::get_env("WHICH_SET", which_set));
  sampling_mode =
      parse_sampling_mode(utils::get_env("SAMPLING_MODE", data_loading::to_string(sampling_mode)));
  verbose = utils::get_env<bool>("VERBOSE", verbose);
  if (utils::has_env("SEED")) {
    seed = utils::get_env<uint32_t>("SEED", 0);
  }
}

void DatasetConfig::print_config() const {
  std::cout << "Dataset configuration:" << std::endl;
  std::cout << "  Data paths: ";
  for (size_t i = 0; i < data_paths.size(); ++i) {
    std::cout << data_paths[i] << (i + 1 < data_paths.size() ? ", " : "");
  }
  std::cout << std::endl;
  std::cout << "  Load size: " << load_size.to_string() << std::endl;
  std::cout << "  Sample size: " << effective_sample_size().to_string() << std::endl;
  std::cout << "  Which set: " << which_set << std::endl;
  std::cout << "  Sampling mode: " << data_loading::to_string(sampling_mode) << std::endl;
  std::cout << "  Verbose: " << (verbose ? "Yes" : "No") << std::endl;
  if (seed) {
    std::cout << "  Seed: " << *seed << std::endl;
  }
}

} // namespace data_loading
