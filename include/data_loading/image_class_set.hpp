/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "batch.hpp"
#include "carry.hpp"
#include "class_catalog.hpp"
#include "data_set.hpp"
#include "dataset_config.hpp"
#include "file_enumerator.hpp"
#include "image_codec.hpp"
#include "index_selector.hpp"
#include "path_table.hpp"
#include "tensor/tensor.hpp"

namespace data_loading {

// Global sample indices [begin, begin + count) belonging to one class.
struct ClassRange {
  size_t begin = 0;
  size_t count = 0;

  size_t end() const { return begin + count; }
};

class BatchIterator;

/**
 * Image classification dataset over a flat folder structure:
 *   [data_path]/[class]/.../[image].jpg  (folder name is class name)
 *
 * Built for very large corpora (tens of millions of images). Construction walks
 * every class folder once, streams the matching paths into per-class scratch
 * files, then packs them into a fixed-width PathTable grouped by class. Only the
 * path bytes and one class id per image stay in memory; pixels are decoded on
 * demand for each batch.
 */
class ImageClassSet : public DataSet {
public:
  // Decodes the file at `path` into a (C, H, W) or (M, C, H, W) float sample.
  using SampleHook = std::function<Tensor<float>(const std::string &path)>;

  /**
   * @throws utils::EmptyDatasetError if no image is found
   * @throws utils::EmptyClassError if a class folder contains no image
   */
  ImageClassSet(const DatasetConfig &config, std::shared_ptr<const ImageCodec> codec,
                std::shared_ptr<const FileEnumerator> enumerator =
                    std::make_shared<FilesystemEnumerator>(),
                std::shared_ptr<const Carry> carry = std::make_shared<EmptyCarry>());

  ImageClassSet(const ImageClassSet &) = delete;
  ImageClassSet &operator=(const ImageClassSet &) = delete;

  // Sampling (training)

  Batch sample(size_t quantity) override;

  // Uniform over classes first, then uniform within the class.
  Batch sample_balanced(size_t quantity);

  // Uniform over all samples, so large classes are drawn more often.
  Batch sample_random(size_t quantity);

  Tensor<float> get_by_class(size_t class_id);

  // Deterministic gathers (evaluation)

  Batch get(const IndexSelector &selector) const override;
  Batch get_range(size_t start, size_t stop) const;
  Batch get_by_indices(const std::vector<size_t> &indices) const;

  /**
   * Batch factories. The overloads taking a Batch overwrite its buffers in place
   * and only reallocate when the batch shape changes.
   */
  Batch sub(size_t start, size_t stop) const;
  Batch &sub(Batch &batch, size_t start, size_t stop) const;
  Batch index(const std::vector<size_t> &indices) const;
  Batch &index(Batch &batch, const std::vector<size_t> &indices) const;
  Batch batch(size_t batch_size) const;

  /**
   * Stack equally shaped samples into a batch. A (C, H, W) sample fills one row,
   * a (M, C, H, W) sample fills M rows sharing its label.
   * @throws utils::ShapeMismatchError on inconsistent shapes or counts
   */
  Batch batch_to_tensor(std::vector<Tensor<float>> samples,
                        const std::vector<int64_t> &labels) const;
  void batch_to_tensor(Batch &batch, std::vector<Tensor<float>> samples,
                       const std::vector<int64_t> &labels) const;

  /**
   * One pass over the dataset in index order. The dataset must outlive the
   * iterator.
   */
  BatchIterator iterate(size_t batch_size) const;

  // Default decode step: decode at load_size, resize to sample_size if different.
  Tensor<float> load_image(const std::string &path) const;

  // Hooks must be safe to call concurrently; an empty hook restores load_image.
  void set_train_hook(SampleHook hook) { train_hook_ = std::move(hook); }
  void set_test_hook(SampleHook hook) { test_hook_ = std::move(hook); }

  // Index queries

  size_t size() const override { return paths_.size(); }
  size_t size(size_t class_id) const { return class_range(class_id).count; }
  size_t size(const std::string &class_name) const { return size(catalog_.id(class_name)); }

  std::vector<size_t> get_image_shape() const override { return sample_size_.to_vector(); }
  size_t get_num_classes() const override { return catalog_.size(); }
  std::vector<std::string> get_class_names() const override { return catalog_.names(); }

  size_t num_classes() const { return catalog_.size(); }
  const ClassCatalog &catalog() const { return catalog_; }
  size_t class_id(const std::string &name) const { return catalog_.id(name); }
  ClassRange class_range(size_t class_id) const;

  std::string_view path(size_t index) const { return paths_.get(index); }
  int64_t class_of(size_t index) const;
  size_t path_width() const { return paths_.width(); }

  SamplingMode sampling_mode() const { return sampling_mode_; }
  const ImageShape &load_size() const { return load_size_; }
  const ImageShape &sample_size() const { return sample_size_; }

  void print_data_stats() const;

private:
  void build_index(const std::vector<std::string> &data_paths);

  Batch gather(const std::vector<size_t> &indices, const SampleHook &hook) const;
  void gather_into(Batch &batch, const std::vector<size_t> &indices,
                   const SampleHook &hook) const;
  std::vector<Tensor<float>> decode_all(const std::vector<size_t> &indices,
                                        const SampleHook &hook) const;

  ImageShape load_size_;
  ImageShape sample_size_;
  SamplingMode sampling_mode_;
  bool verbose_;

  std::shared_ptr<const ImageCodec> codec_;
  std::shared_ptr<const FileEnumerator> enumerator_;
  std::shared_ptr<const Carry> carry_;

  ClassCatalog catalog_;
  PathTable paths_;
  std::vector<uint32_t> class_ids_;
  std::vector<ClassRange> class_ranges_;

  SampleHook train_hook_;
  SampleHook test_hook_;
};

/**
 * Lazy, finite, non-restartable pass over an ImageClassSet in index order. The
 * last batch is shorter when the dataset size is not a multiple of batch_size.
 */
class BatchIterator {
public:
  BatchIterator(const ImageClassSet &dataset, size_t batch_size);

  // Fills `batch` with the next batch, reusing its buffers; false when exhausted.
  bool next(Batch &batch);

  bool has_next() const { return next_index_ < dataset_->size(); }
  size_t num_batches() const {
    return (dataset_->size() + batch_size_ - 1) / batch_size_;
  }
  size_t batch_size() const { return batch_size_; }

private:
  const ImageClassSet *dataset_;
  size_t batch_size_;
  size_t next_index_ = 0;
};

} // namespace data_loading
