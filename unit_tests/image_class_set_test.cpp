/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#include "data_loading/image_class_set.hpp"
#include "utils/errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

using namespace data_loading;
namespace fs = std::filesystem;

namespace {

// Fills every pixel with the number in the file stem ("12.jpg" -> 12.0f).
class StemValueCodec : public ImageCodec {
public:
  explicit StemValueCodec(size_t channels = 3) : channels_(channels) {}

  Tensor<float> decode(const std::string &path, size_t height, size_t width) const override {
    const std::string stem = fs::path(path).stem().string();
    if (stem.rfind("bad", 0) == 0) {
      throw std::runtime_error("Failed to decode image: " + path);
    }
    Tensor<float> image({channels_, height, width});
    image.fill(std::stof(stem));
    return image;
  }

  Tensor<float> resize(const Tensor<float> &image, size_t height, size_t width) const override {
    Tensor<float> resized({image.dimension(0), height, width});
    resized.fill(image.data()[0]);
    return resized;
  }

  size_t channels() const override { return channels_; }

private:
  size_t channels_;
};

// Per-sample ids that follow the samples through slices and gathers.
class IdCarry : public Carry {
public:
  explicit IdCarry(std::vector<size_t> ids) : ids(std::move(ids)) {}

  std::unique_ptr<Carry> slice(size_t start, size_t stop) const override {
    return std::make_unique<IdCarry>(
        std::vector<size_t>(ids.begin() + start, ids.begin() + stop + 1));
  }

  std::unique_ptr<Carry> gather(const std::vector<size_t> &indices) const override {
    std::vector<size_t> picked;
    for (size_t i : indices) {
      picked.push_back(ids[i]);
    }
    return std::make_unique<IdCarry>(picked);
  }

  std::vector<size_t> ids;
};

} // namespace

class ImageClassSetTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    base_ = fs::temp_directory_path() / ("imageclassset_test_" + std::to_string(rd()));
    data_ = base_ / "data";
    scratch_ = base_ / "scratch";
    fs::create_directories(data_);
    fs::create_directories(scratch_);
    setenv("DATAVIEW_SCRATCH_DIR", scratch_.c_str(), 1);

    // cat: 3 images, dog: 2 images and a stray text file, fish: 1 nested image
    touch(data_ / "cat" / "0.jpg");
    touch(data_ / "cat" / "1.jpg");
    touch(data_ / "cat" / "2.JPEG");
    touch(data_ / "dog" / "10.png");
    touch(data_ / "dog" / "11.png");
    touch(data_ / "dog" / "notes.txt");
    touch(data_ / "fish" / "nested" / "20.jpg");
  }

  void TearDown() override {
    unsetenv("DATAVIEW_SCRATCH_DIR");
    std::error_code ec;
    fs::remove_all(base_, ec);
  }

  static void touch(const fs::path &file) {
    fs::create_directories(file.parent_path());
    std::ofstream(file).put('\0');
  }

  DatasetConfig make_config(size_t size = 4) const {
    DatasetConfig config;
    config.data_paths = {data_.string()};
    config.load_size = ImageShape{3, size, size};
    config.verbose = false;
    config.seed = 42;
    return config;
  }

  std::unique_ptr<ImageClassSet> make_set(std::shared_ptr<const Carry> carry = nullptr) const {
    if (!carry) {
      carry = std::make_shared<EmptyCarry>();
    }
    return std::make_unique<ImageClassSet>(make_config(), std::make_shared<StemValueCodec>(),
                                           std::make_shared<FilesystemEnumerator>(), carry);
  }

  static std::vector<float> first_pixels(const Batch &batch) {
    std::vector<float> values;
    for (size_t i = 0; i < batch.size(); ++i) {
      values.push_back(batch.inputs(i, 0, 0, 0));
    }
    return values;
  }

  static std::vector<int64_t> labels(const Batch &batch) {
    return std::vector<int64_t>(batch.labels.data(), batch.labels.data() + batch.labels.size());
  }

  fs::path base_;
  fs::path data_;
  fs::path scratch_;
};

// ==================== Index Construction Tests ====================

TEST_F(ImageClassSetTest, DiscoversClassesInSortedOrder) {
  auto set = make_set();

  EXPECT_THAT(set->get_class_names(), ::testing::ElementsAre("cat", "dog", "fish"));
  EXPECT_EQ(set->num_classes(), 3u);
  EXPECT_EQ(set->size(), 6u);
  EXPECT_EQ(set->class_id("dog"), 1u);
  EXPECT_EQ(set->size("cat"), 3u);
  EXPECT_EQ(set->size(size_t(2)), 1u);
}

TEST_F(ImageClassSetTest, ClassRangesPartitionSamples) {
  auto set = make_set();

  std::vector<size_t> owner(set->size(), set->num_classes());
  for (size_t c = 0; c < set->num_classes(); ++c) {
    const ClassRange range = set->class_range(c);
    for (size_t i = range.begin; i < range.end(); ++i) {
      ASSERT_EQ(owner[i], set->num_classes()) << "sample " << i << " claimed twice";
      owner[i] = c;
      EXPECT_EQ(set->class_of(i), static_cast<int64_t>(c));
    }
  }
  for (size_t i = 0; i < owner.size(); ++i) {
    EXPECT_LT(owner[i], set->num_classes()) << "sample " << i << " not covered";
  }
}

TEST_F(ImageClassSetTest, PathsAreGroupedByClass) {
  auto set = make_set();

  EXPECT_EQ(fs::path(std::string(set->path(0))).filename(), "0.jpg");
  EXPECT_EQ(fs::path(std::string(set->path(2))).filename(), "2.JPEG");
  EXPECT_EQ(fs::path(std::string(set->path(3))).filename(), "10.png");
  EXPECT_EQ(fs::path(std::string(set->path(5))).filename(), "20.jpg");

  size_t longest = 0;
  for (size_t i = 0; i < set->size(); ++i) {
    longest = std::max(longest, set->path(i).size());
  }
  EXPECT_EQ(set->path_width(), longest + 1);
}

TEST_F(ImageClassSetTest, MergesClassesAcrossDataPaths) {
  const fs::path second = base_ / "more";
  touch(second / "dog" / "12.jpg");
  touch(second / "bird" / "30.jpg");

  DatasetConfig config = make_config();
  config.data_paths.push_back(second.string());
  ImageClassSet set(config, std::make_shared<StemValueCodec>());

  EXPECT_THAT(set.get_class_names(), ::testing::ElementsAre("cat", "dog", "fish", "bird"));
  EXPECT_EQ(set.size("dog"), 3u);
  EXPECT_EQ(set.size(), 8u);
}

TEST_F(ImageClassSetTest, EmptyClassFolderThrows) {
  touch(data_ / "eel" / "readme.txt");

  try {
    make_set();
    FAIL() << "expected EmptyClassError";
  } catch (const utils::EmptyClassError &e) {
    EXPECT_EQ(e.class_name(), "eel");
  }
}

TEST_F(ImageClassSetTest, NoClassFoldersThrows) {
  const fs::path empty_root = base_ / "empty_root";
  fs::create_directories(empty_root);
  DatasetConfig config = make_config();
  config.data_paths = {empty_root.string()};

  EXPECT_THROW(ImageClassSet(config, std::make_shared<StemValueCodec>()),
               utils::EmptyDatasetError);
}

TEST_F(ImageClassSetTest, AllClassFoldersEmptyReportsEmptyDataset) {
  const fs::path empty_root = base_ / "empty_classes";
  touch(empty_root / "eel" / "readme.txt");
  DatasetConfig config = make_config();
  config.data_paths = {empty_root.string()};

  EXPECT_THROW(ImageClassSet(config, std::make_shared<StemValueCodec>()),
               utils::EmptyDatasetError);
}

TEST_F(ImageClassSetTest, CodecChannelsMustMatchLoadSize) {
  DatasetConfig config = make_config();
  config.load_size = ImageShape{1, 2, 2};

  EXPECT_THROW(ImageClassSet(config, std::make_shared<StemValueCodec>(3)), std::invalid_argument);

  ImageClassSet gray(config, std::make_shared<StemValueCodec>(1));
  Batch batch = gray.get_range(0, 1);
  EXPECT_THAT(batch.inputs.shape(), ::testing::ElementsAre(2, 1, 2, 2));
  EXPECT_EQ(batch.inputs.dimension(1), gray.get_image_shape()[0]);
}

TEST_F(ImageClassSetTest, ScratchFilesAreRemoved) {
  make_set();
  EXPECT_TRUE(fs::is_empty(scratch_));

  touch(data_ / "eel" / "readme.txt");
  EXPECT_THROW(make_set(), utils::EmptyClassError);
  EXPECT_TRUE(fs::is_empty(scratch_));
}

// ==================== Deterministic Gather Tests ====================

TEST_F(ImageClassSetTest, GetRangeIsInclusiveAndAscending) {
  auto set = make_set();

  Batch batch = set->get_range(1, 4);
  ASSERT_EQ(batch.size(), 4u);
  EXPECT_THAT(batch.inputs.shape(), ::testing::ElementsAre(4, 3, 4, 4));
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(1.0f, 2.0f, 10.0f, 11.0f));
  EXPECT_THAT(labels(batch), ::testing::ElementsAre(0, 0, 1, 1));
  EXPECT_EQ(batch.epoch_size, 6u);
  EXPECT_EQ(batch.which_set, "train");
}

TEST_F(ImageClassSetTest, GetRangeRejectsBadBounds) {
  auto set = make_set();

  EXPECT_THROW(set->get_range(5, 3), utils::IndexRangeError);
  EXPECT_THROW(set->get_range(0, 6), utils::IndexRangeError);
  EXPECT_THROW(set->get(std::vector<size_t>{}), utils::IndexRangeError);
  EXPECT_THROW(set->get(size_t(6)), utils::IndexRangeError);
}

TEST_F(ImageClassSetTest, IndexKeepsRequestedOrder) {
  auto set = make_set();

  Batch batch = set->index({3, 1, 2});
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(10.0f, 1.0f, 2.0f));
  EXPECT_THAT(labels(batch), ::testing::ElementsAre(1, 0, 0));
}

TEST_F(ImageClassSetTest, MultiHotMarksTrueClass) {
  auto set = make_set();

  Batch batch = set->get_by_indices({5, 0});
  ASSERT_THAT(batch.multi_hot.shape(), ::testing::ElementsAre(2, 3));
  EXPECT_EQ(batch.multi_hot(0, 0), -1);
  EXPECT_EQ(batch.multi_hot(0, 1), -1);
  EXPECT_EQ(batch.multi_hot(0, 2), 1);
  EXPECT_EQ(batch.multi_hot(1, 0), 1);
  EXPECT_EQ(batch.multi_hot(1, 1), -1);
}

TEST_F(ImageClassSetTest, ResizesToSampleSize) {
  DatasetConfig config = make_config(8);
  config.sample_size = ImageShape{3, 2, 5};
  ImageClassSet set(config, std::make_shared<StemValueCodec>());

  Batch batch = set.get_range(0, 1);
  EXPECT_THAT(batch.inputs.shape(), ::testing::ElementsAre(2, 3, 2, 5));
  EXPECT_THAT(set.get_image_shape(), ::testing::ElementsAre(3, 2, 5));
}

TEST_F(ImageClassSetTest, TestHookReplacesDecoder) {
  auto set = make_set();
  set->set_test_hook([](const std::string &) {
    Tensor<float> sample({3, 1, 1});
    sample.fill(7.0f);
    return sample;
  });

  Batch batch = set->get_range(0, 2);
  EXPECT_THAT(batch.inputs.shape(), ::testing::ElementsAre(3, 3, 1, 1));
  EXPECT_THAT(first_pixels(batch), ::testing::Each(7.0f));

  set->set_test_hook(nullptr);
  EXPECT_THAT(first_pixels(set->get_range(0, 0)), ::testing::ElementsAre(0.0f));
}

TEST_F(ImageClassSetTest, DecodeFailurePropagates) {
  touch(data_ / "dog" / "bad_frame.jpg");
  auto set = make_set();

  EXPECT_THROW(set->get_range(0, set->size() - 1), std::runtime_error);
}

// ==================== Batch Reuse Tests ====================

TEST_F(ImageClassSetTest, InPlaceSubReusesBuffers) {
  auto set = make_set();

  Batch batch;
  set->sub(batch, 0, 2);
  const float *inputs = batch.inputs.data();
  const int64_t *multi_hot = batch.multi_hot.data();

  set->sub(batch, 3, 5);
  EXPECT_EQ(batch.inputs.data(), inputs);
  EXPECT_EQ(batch.multi_hot.data(), multi_hot);
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(10.0f, 11.0f, 20.0f));
  EXPECT_THAT(labels(batch), ::testing::ElementsAre(1, 1, 2));
}

TEST_F(ImageClassSetTest, InPlaceIndexReusesAndResizesBuffers) {
  auto set = make_set(std::make_shared<IdCarry>(std::vector<size_t>{100, 101, 102, 103, 104, 105}));

  Batch batch;
  set->index(batch, {0, 4});
  const float *inputs = batch.inputs.data();
  const int64_t *labels_data = batch.labels.data();
  const int64_t *multi_hot = batch.multi_hot.data();

  set->index(batch, {5, 1});
  EXPECT_EQ(batch.inputs.data(), inputs);
  EXPECT_EQ(batch.labels.data(), labels_data);
  EXPECT_EQ(batch.multi_hot.data(), multi_hot);
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(20.0f, 1.0f));
  EXPECT_THAT(labels(batch), ::testing::ElementsAre(2, 0));

  set->index(batch, {3, 0, 5});
  EXPECT_THAT(batch.inputs.shape(), ::testing::ElementsAre(3, 3, 4, 4));
  EXPECT_THAT(batch.labels.shape(), ::testing::ElementsAre(3));
  ASSERT_THAT(batch.multi_hot.shape(), ::testing::ElementsAre(3, 3));
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(10.0f, 0.0f, 20.0f));
  EXPECT_THAT(labels(batch), ::testing::ElementsAre(1, 0, 2));
  const std::vector<int64_t> hot(batch.multi_hot.data(), batch.multi_hot.data() + 9);
  EXPECT_THAT(hot, ::testing::ElementsAre(-1, 1, -1, 1, -1, -1, -1, -1, 1));

  auto *carry = dynamic_cast<IdCarry *>(batch.carry.get());
  ASSERT_NE(carry, nullptr);
  EXPECT_THAT(carry->ids, ::testing::ElementsAre(103, 100, 105));
}

TEST_F(ImageClassSetTest, CarryFollowsSlicesAndGathers) {
  auto set = make_set(std::make_shared<IdCarry>(std::vector<size_t>{100, 101, 102, 103, 104, 105}));

  Batch sliced = set->sub(2, 4);
  auto *slice_carry = dynamic_cast<IdCarry *>(sliced.carry.get());
  ASSERT_NE(slice_carry, nullptr);
  EXPECT_THAT(slice_carry->ids, ::testing::ElementsAre(102, 103, 104));

  Batch gathered = set->index({3, 1});
  auto *gather_carry = dynamic_cast<IdCarry *>(gathered.carry.get());
  ASSERT_NE(gather_carry, nullptr);
  EXPECT_THAT(gather_carry->ids, ::testing::ElementsAre(103, 101));
}

TEST_F(ImageClassSetTest, IteratorYieldsShortLastBatch) {
  auto set = make_set();

  BatchIterator it = set->iterate(4);
  EXPECT_EQ(it.num_batches(), 2u);

  Batch batch;
  ASSERT_TRUE(it.next(batch));
  EXPECT_EQ(batch.size(), 4u);
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(0.0f, 1.0f, 2.0f, 10.0f));

  ASSERT_TRUE(it.next(batch));
  EXPECT_EQ(batch.size(), 2u);
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(11.0f, 20.0f));

  EXPECT_FALSE(it.next(batch));
  EXPECT_FALSE(it.has_next());
}

TEST_F(ImageClassSetTest, BatchTakesLeadingSamples) {
  auto set = make_set();

  EXPECT_EQ(set->batch(2).size(), 2u);
  EXPECT_EQ(set->batch(100).size(), 6u);
  EXPECT_THROW(set->batch(0), std::invalid_argument);
}

// ==================== Batch Assembly Tests ====================

TEST_F(ImageClassSetTest, BatchToTensorRejectsInconsistentSamples) {
  auto set = make_set();

  std::vector<Tensor<float>> mixed;
  mixed.emplace_back(std::vector<size_t>{3, 2, 2});
  mixed.emplace_back(std::vector<size_t>{3, 2, 3});
  EXPECT_THROW(set->batch_to_tensor(std::move(mixed), {0, 1}), utils::ShapeMismatchError);

  std::vector<Tensor<float>> one;
  one.emplace_back(std::vector<size_t>{3, 2, 2});
  EXPECT_THROW(set->batch_to_tensor(std::move(one), {0, 1}), utils::ShapeMismatchError);

  EXPECT_THROW(set->batch_to_tensor({}, {}), utils::ShapeMismatchError);
}

TEST_F(ImageClassSetTest, BatchToTensorExpandsMultiSampleDraws) {
  auto set = make_set();

  std::vector<Tensor<float>> draws;
  draws.emplace_back(std::vector<size_t>{2, 3, 1, 1});
  draws.emplace_back(std::vector<size_t>{2, 3, 1, 1});
  draws[1].fill(5.0f);

  Batch batch = set->batch_to_tensor(std::move(draws), {2, 0});
  EXPECT_THAT(batch.inputs.shape(), ::testing::ElementsAre(4, 3, 1, 1));
  EXPECT_THAT(labels(batch), ::testing::ElementsAre(2, 2, 0, 0));
  EXPECT_THAT(first_pixels(batch), ::testing::ElementsAre(0.0f, 0.0f, 5.0f, 5.0f));
}

// ==================== Sampling Tests ====================

class SkewedSamplingTest : public ImageClassSetTest {
protected:
  void SetUp() override {
    ImageClassSetTest::SetUp();
    skewed_ = base_ / "skewed";
    for (size_t i = 0; i < 1000; ++i) {
      touch(skewed_ / "big" / (std::to_string(i) + ".jpg"));
    }
    touch(skewed_ / "small" / "5000.jpg");
  }

  std::unique_ptr<ImageClassSet> make_skewed(SamplingMode mode) const {
    DatasetConfig config = make_config(1);
    config.data_paths = {skewed_.string()};
    config.sampling_mode = mode;
    return std::make_unique<ImageClassSet>(config, std::make_shared<StemValueCodec>());
  }

  fs::path skewed_;
};

TEST_F(SkewedSamplingTest, BalancedDrawsClassesEqually) {
  auto set = make_skewed(SamplingMode::Balanced);

  Batch batch = set->sample(4000);
  ASSERT_EQ(batch.size(), 4000u);
  size_t small = 0;
  for (int64_t label : labels(batch)) {
    small += label == static_cast<int64_t>(set->class_id("small")) ? 1 : 0;
  }
  EXPECT_NEAR(static_cast<double>(small), 2000.0, 200.0);
}

TEST_F(SkewedSamplingTest, RandomDrawsFollowClassSizes) {
  auto set = make_skewed(SamplingMode::Random);

  Batch batch = set->sample(4000);
  size_t small = 0;
  for (int64_t label : labels(batch)) {
    small += label == static_cast<int64_t>(set->class_id("small")) ? 1 : 0;
  }
  EXPECT_LT(small, 40u);
}

TEST_F(SkewedSamplingTest, SeedMakesSamplingReproducible) {
  auto first = make_skewed(SamplingMode::Balanced);
  auto second = make_skewed(SamplingMode::Balanced);

  EXPECT_EQ(labels(first->sample(64)), labels(second->sample(64)));
  EXPECT_EQ(first_pixels(first->sample(16)), first_pixels(second->sample(16)));
}

TEST_F(SkewedSamplingTest, GetByClassStaysInClass) {
  auto set = make_skewed(SamplingMode::Balanced);

  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(set->get_by_class(set->class_id("small")).data()[0], 5000.0f);
  }
  EXPECT_THROW(set->get_by_class(2), utils::IndexRangeError);
}

TEST_F(SkewedSamplingTest, ZeroQuantityIsRejected) {
  auto set = make_skewed(SamplingMode::Balanced);
  EXPECT_THROW(set->sample(0), std::invalid_argument);
}
