/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include "data_loading/image_class_set.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <system_error>

#include "utils/env.hpp"
#include "utils/errors.hpp"
#include "utils/parallel_for.hpp"

namespace fs = std::filesystem;

namespace data_loading {

namespace {

constexpr size_t PROGRESS_INTERVAL = 100000;

/**
 * Directory holding the per-class path lists produced during construction.
 * Removed with everything in it when the build finishes or fails.
 */
class ScratchDirectory {
public:
  ScratchDirectory() {
    const fs::path base =
        utils::get_env("DATAVIEW_SCRATCH_DIR", fs::temp_directory_path().string());
    std::random_device rd;
    for (int attempt = 0; attempt < 16; ++attempt) {
      fs::path candidate = base / ("imageclassset-" + std::to_string(rd()));
      if (fs::create_directories(candidate)) {
        path_ = candidate;
        return;
      }
    }
    throw std::runtime_error("Could not create a scratch directory under " + base.string());
  }

  ~ScratchDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
      std::cerr << "Warning: could not remove scratch directory " << path_ << ": "
                << ec.message() << std::endl;
    }
  }

  ScratchDirectory(const ScratchDirectory &) = delete;
  ScratchDirectory &operator=(const ScratchDirectory &) = delete;

  fs::path file(size_t class_id) const {
    return path_ / ("class_" + std::to_string(class_id) + ".lst");
  }

private:
  fs::path path_;
};

} // namespace

ImageClassSet::ImageClassSet(const DatasetConfig &config, std::shared_ptr<const ImageCodec> codec,
                             std::shared_ptr<const FileEnumerator> enumerator,
                             std::shared_ptr<const Carry> carry)
    : load_size_(config.load_size), sample_size_(config.effective_sample_size()),
      sampling_mode_(config.sampling_mode), verbose_(config.verbose), codec_(std::move(codec)),
      enumerator_(std::move(enumerator)), carry_(std::move(carry)) {
  config.validate();
  if (!codec_ || !enumerator_ || !carry_) {
    throw std::invalid_argument("ImageClassSet requires a codec, an enumerator and a carry");
  }
  if (codec_->channels() != load_size_.channels) {
    throw std::invalid_argument("Codec decodes " + std::to_string(codec_->channels()) +
                                " channels but load_size expects " +
                                std::to_string(load_size_.channels));
  }
  which_set_ = config.which_set;
  if (config.seed) {
    set_seed(*config.seed);
  }
  build_index(config.data_paths);
}

void ImageClassSet::build_index(const std::vector<std::string> &data_paths) {
  catalog_ = ClassCatalog::discover(data_paths, *enumerator_);
  if (verbose_) {
    std::cout << "found " << catalog_.size() << " classes" << std::endl;
  }
  if (catalog_.empty()) {
    throw utils::EmptyDatasetError("Could not find any class folder in the given input paths");
  }

  ScratchDirectory scratch;
  const size_t num_classes = catalog_.size();
  std::vector<size_t> counts(num_classes, 0);
  size_t max_path_length = 0;

  if (verbose_) {
    std::cout << "Enumerating image files of each class folder" << std::endl;
  }
  for (size_t c = 0; c < num_classes; ++c) {
    std::ofstream out(scratch.file(c), std::ios::binary);
    if (!out.is_open()) {
      throw std::runtime_error("Could not open scratch file " + scratch.file(c).string());
    }
    for (const auto &folder : catalog_.folders(c)) {
      counts[c] += enumerator_->for_each_image(folder, [&](const std::string &path) {
        out.write(path.data(), static_cast<std::streamsize>(path.size()));
        out.put('\0');
        max_path_length = std::max(max_path_length, path.size());
      });
    }
    out.close();
    if (!out) {
      throw std::runtime_error("Failed to write scratch file " + scratch.file(c).string());
    }
  }

  size_t total = 0;
  for (size_t count : counts) {
    total += count;
  }
  if (total == 0) {
    throw utils::EmptyDatasetError("Could not find any image file in the given input paths");
  }
  for (size_t c = 0; c < num_classes; ++c) {
    if (counts[c] == 0) {
      throw utils::EmptyClassError(catalog_.name(c));
    }
  }

  if (verbose_) {
    std::cout << "Loading " << total << " sample paths (record width " << max_path_length + 1
              << ")" << std::endl;
  }
  paths_ = PathTable(total, max_path_length + 1);
  class_ids_.assign(total, 0);
  class_ranges_.assign(num_classes, ClassRange{});

  size_t running_index = 0;
  for (size_t c = 0; c < num_classes; ++c) {
    std::ifstream in(scratch.file(c), std::ios::binary);
    if (!in.is_open()) {
      throw std::runtime_error("Could not reopen scratch file " + scratch.file(c).string());
    }
    const size_t begin = running_index;
    std::string line;
    while (std::getline(in, line, '\0')) {
      if (running_index - begin >= counts[c]) {
        break;
      }
      paths_.set(running_index, line);
      class_ids_[running_index] = static_cast<uint32_t>(c);
      ++running_index;
      if (verbose_ && running_index % PROGRESS_INTERVAL == 0) {
        std::cout << "  " << running_index << "/" << total << " paths loaded" << std::endl;
      }
    }
    if (running_index - begin != counts[c]) {
      throw std::runtime_error("Scratch file of class '" + catalog_.name(c) + "' holds " +
                               std::to_string(running_index - begin) + " paths, expected " +
                               std::to_string(counts[c]));
    }
    class_ranges_[c] = ClassRange{begin, counts[c]};
  }

  if (verbose_) {
    std::cout << total << " samples found." << std::endl;
  }
}

ClassRange ImageClassSet::class_range(size_t class_id) const {
  if (class_id >= class_ranges_.size()) {
    throw utils::IndexRangeError("Class id " + std::to_string(class_id) + " out of range [0, " +
                                 std::to_string(class_ranges_.size()) + ")");
  }
  return class_ranges_[class_id];
}

int64_t ImageClassSet::class_of(size_t index) const {
  if (index >= class_ids_.size()) {
    throw utils::IndexRangeError("Sample index " + std::to_string(index) + " out of range [0, " +
                                 std::to_string(class_ids_.size()) + ")");
  }
  return static_cast<int64_t>(class_ids_[index]);
}

Tensor<float> ImageClassSet::load_image(const std::string &path) const {
  Tensor<float> image = codec_->decode(path, load_size_.height, load_size_.width);
  if (sample_size_.height != load_size_.height || sample_size_.width != load_size_.width) {
    return codec_->resize(image, sample_size_.height, sample_size_.width);
  }
  return image;
}

Batch ImageClassSet::sample(size_t quantity) {
  switch (sampling_mode_) {
  case SamplingMode::Balanced:
    return sample_balanced(quantity);
  case SamplingMode::Random:
    return sample_random(quantity);
  }
  throw utils::UnsupportedModeError("Unknown sampling mode");
}

Batch ImageClassSet::sample_balanced(size_t quantity) {
  if (quantity == 0) {
    throw std::invalid_argument("sample quantity must be at least 1");
  }
  if (class_ranges_.empty()) {
    throw utils::UnsupportedModeError("Cannot sample from a dataset without classes");
  }

  std::uniform_int_distribution<size_t> class_dist(0, class_ranges_.size() - 1);
  std::vector<size_t> indices;
  indices.reserve(quantity);
  for (size_t i = 0; i < quantity; ++i) {
    const ClassRange &range = class_ranges_[class_dist(rng_)];
    std::uniform_int_distribution<size_t> within(0, range.count - 1);
    indices.push_back(range.begin + within(rng_));
  }
  return gather(indices, train_hook_);
}

Batch ImageClassSet::sample_random(size_t quantity) {
  if (quantity == 0) {
    throw std::invalid_argument("sample quantity must be at least 1");
  }
  if (paths_.size() == 0) {
    throw utils::UnsupportedModeError("Cannot sample from an empty dataset");
  }

  std::uniform_int_distribution<size_t> dist(0, paths_.size() - 1);
  std::vector<size_t> indices;
  indices.reserve(quantity);
  for (size_t i = 0; i < quantity; ++i) {
    indices.push_back(dist(rng_));
  }
  return gather(indices, train_hook_);
}

Tensor<float> ImageClassSet::get_by_class(size_t class_id) {
  const ClassRange range = class_range(class_id);
  std::uniform_int_distribution<size_t> within(0, range.count - 1);
  const std::string image_path(paths_.get(range.begin + within(rng_)));
  return train_hook_ ? train_hook_(image_path) : load_image(image_path);
}

Batch ImageClassSet::get(const IndexSelector &selector) const {
  return gather(resolve_indices(selector, paths_.size()), test_hook_);
}

Batch ImageClassSet::get_range(size_t start, size_t stop) const {
  return get(IndexRange{start, stop});
}

Batch ImageClassSet::get_by_indices(const std::vector<size_t> &indices) const {
  return get(indices);
}

Batch ImageClassSet::sub(size_t start, size_t stop) const {
  Batch batch;
  sub(batch, start, stop);
  return batch;
}

Batch &ImageClassSet::sub(Batch &batch, size_t start, size_t stop) const {
  const std::vector<size_t> indices = resolve_indices(IndexRange{start, stop}, paths_.size());
  gather_into(batch, indices, test_hook_);
  batch.carry = carry_->slice(start, stop);
  return batch;
}

Batch ImageClassSet::index(const std::vector<size_t> &indices) const {
  Batch batch;
  index(batch, indices);
  return batch;
}

Batch &ImageClassSet::index(Batch &batch, const std::vector<size_t> &indices) const {
  const std::vector<size_t> checked = resolve_indices(indices, paths_.size());
  gather_into(batch, checked, test_hook_);
  return batch;
}

Batch ImageClassSet::batch(size_t batch_size) const {
  if (batch_size == 0) {
    throw std::invalid_argument("batch_size must be at least 1");
  }
  return sub(0, std::min(batch_size, paths_.size()) - 1);
}

Batch ImageClassSet::gather(const std::vector<size_t> &indices, const SampleHook &hook) const {
  Batch batch;
  gather_into(batch, indices, hook);
  return batch;
}

void ImageClassSet::gather_into(Batch &batch, const std::vector<size_t> &indices,
                                const SampleHook &hook) const {
  std::vector<int64_t> labels;
  labels.reserve(indices.size());
  for (size_t index : indices) {
    labels.push_back(static_cast<int64_t>(class_ids_[index]));
  }
  batch_to_tensor(batch, decode_all(indices, hook), labels);
  batch.carry = carry_->gather(indices);
}

std::vector<Tensor<float>> ImageClassSet::decode_all(const std::vector<size_t> &indices,
                                                     const SampleHook &hook) const {
  std::vector<Tensor<float>> samples(indices.size());
  utils::parallel_for_rethrow<size_t>(0, indices.size(), [&](size_t i) {
    const std::string image_path(paths_.get(indices[i]));
    samples[i] = hook ? hook(image_path) : load_image(image_path);
  });
  return samples;
}

Batch ImageClassSet::batch_to_tensor(std::vector<Tensor<float>> samples,
                                     const std::vector<int64_t> &labels) const {
  Batch batch;
  batch_to_tensor(batch, std::move(samples), labels);
  batch.carry = std::make_unique<EmptyCarry>();
  return batch;
}

void ImageClassSet::batch_to_tensor(Batch &batch, std::vector<Tensor<float>> samples,
                                    const std::vector<int64_t> &labels) const {
  if (samples.empty()) {
    throw utils::ShapeMismatchError("Cannot build a batch from zero samples");
  }
  if (samples.size() != labels.size()) {
    throw utils::ShapeMismatchError("Got " + std::to_string(samples.size()) + " samples but " +
                                    std::to_string(labels.size()) + " labels");
  }

  const std::vector<size_t> &sample_shape = samples[0].shape();
  if (sample_shape.size() != 3 && sample_shape.size() != 4) {
    throw utils::ShapeMismatchError("Samples must be (C, H, W) or (M, C, H, W), got " +
                                    samples[0].shape_str());
  }
  for (size_t i = 1; i < samples.size(); ++i) {
    if (samples[i].shape() != sample_shape) {
      throw utils::ShapeMismatchError("Sample " + std::to_string(i) + " has shape " +
                                      samples[i].shape_str() + ", expected " +
                                      samples[0].shape_str());
    }
  }

  const size_t per_draw = sample_shape.size() == 4 ? sample_shape[0] : 1;
  const size_t row_size = samples[0].size() / std::max<size_t>(per_draw, 1);
  const size_t rows = samples.size() * per_draw;
  const size_t num_classes = catalog_.size();

  std::vector<size_t> input_shape{rows};
  input_shape.insert(input_shape.end(), sample_shape.end() - 3, sample_shape.end());
  if (batch.inputs.shape() != input_shape) {
    batch.inputs.resize(input_shape);
  }
  if (batch.labels.shape() != std::vector<size_t>{rows}) {
    batch.labels.resize({rows});
  }
  if (batch.multi_hot.shape() != std::vector<size_t>{rows, num_classes}) {
    batch.multi_hot.resize({rows, num_classes});
  }
  batch.multi_hot.fill(MULTI_HOT_BACKGROUND);

  for (size_t i = 0; i < samples.size(); ++i) {
    const int64_t label = labels[i];
    if (label < 0 || static_cast<size_t>(label) >= num_classes) {
      throw utils::IndexRangeError("Label " + std::to_string(label) + " out of range [0, " +
                                   std::to_string(num_classes) + ")");
    }
    std::copy(samples[i].data(), samples[i].data() + samples[i].size(),
              batch.inputs.data() + i * per_draw * row_size);
    for (size_t m = 0; m < per_draw; ++m) {
      const size_t row = i * per_draw + m;
      batch.labels(row) = label;
      batch.multi_hot(row, static_cast<size_t>(label)) = MULTI_HOT_TARGET;
    }
  }

  batch.which_set = which_set_;
  batch.epoch_size = paths_.size();
}

BatchIterator ImageClassSet::iterate(size_t batch_size) const {
  return BatchIterator(*this, batch_size);
}

void ImageClassSet::print_data_stats() const {
  std::cout << "ImageClassSet Statistics (" << which_set_ << "):" << std::endl;
  std::cout << "Total samples: " << paths_.size() << std::endl;
  std::cout << "Sample shape: " << sample_size_.to_string() << std::endl;
  std::cout << "Path record width: " << paths_.width() << " bytes ("
            << paths_.memory_bytes() / (1024 * 1024) << " MiB)" << std::endl;
  std::cout << "Class distribution:" << std::endl;
  for (size_t c = 0; c < catalog_.size(); ++c) {
    std::cout << "  " << catalog_.name(c) << " (" << c << "): " << class_ranges_[c].count
              << " samples" << std::endl;
  }
}

BatchIterator::BatchIterator(const ImageClassSet &dataset, size_t batch_size)
    : dataset_(&dataset), batch_size_(batch_size) {
  if (batch_size == 0) {
    throw std::invalid_argument("batch_size must be at least 1");
  }
}

bool BatchIterator::next(Batch &batch) {
  if (!has_next()) {
    return false;
  }
  const size_t stop = std::min(next_index_ + batch_size_, dataset_->size()) - 1;
  dataset_->sub(batch, next_index_, stop);
  next_index_ = stop + 1;
  return true;
}

} // namespace data_loading
