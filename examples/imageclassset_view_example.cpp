/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#ifdef USE_TBB
#include <tbb/global_control.h>
#endif

#include "data_loading/image_class_set.hpp"
#include "utils/env.hpp"
#include "view/view.hpp"

namespace example_constants {

constexpr size_t SAMPLE_BATCH_SIZE = 32;
constexpr size_t EVAL_BATCH_SIZE = 128;
constexpr size_t PROGRESS_PRINT_INTERVAL = 100;

} // namespace example_constants

// Usage: imageclassset_view_example [config.json]
// Without a config file the dataset is configured from DATA_PATHS, LOAD_SIZE, ...
int main(int argc, char *argv[]) {
  try {
    std::cout << "ImageClassSet / View example" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

#ifdef USE_TBB
    const size_t max_threads = utils::get_env<size_t>("MAX_THREADS", 8);
    tbb::global_control c(tbb::global_control::max_allowed_parallelism, max_threads);
#endif

    data_loading::DatasetConfig config;
    if (argc > 1) {
      config = data_loading::DatasetConfig::load_from_file(argv[1]);
    } else {
      config.load_size = data_loading::ImageShape{3, 224, 224};
      config.load_from_env();
    }
    config.print_config();

    auto codec = std::make_shared<data_loading::OpenCVImageCodec>(config.load_size.channels);
    const auto build_start = std::chrono::high_resolution_clock::now();
    data_loading::ImageClassSet dataset(config, codec);
    const auto build_end = std::chrono::high_resolution_clock::now();
    std::cout << "Index built in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(build_end - build_start)
                     .count()
              << " ms" << std::endl;
    dataset.print_data_stats();

    // One training step worth of data flow through views
    data_loading::Batch batch = dataset.sample(example_constants::SAMPLE_BATCH_SIZE);
    tview::View inputs;
    inputs.forward_put("bchw", batch.inputs);
    tview::View targets;
    targets.forward_put("b", batch.labels);

    const Tensor<float> &features = inputs.forward_get<float>("bf");
    const Tensor<int64_t> &labels = targets.forward_get<int64_t>("b");
    std::cout << "Sampled " << batch.size() << " images as features " << features.shape_str()
              << " with labels " << labels.shape_str() << std::endl;

    Tensor<float> grad(features.shape());
    grad.fill(1.0f);
    inputs.backward_put("bf", std::move(grad));
    const Tensor<float> &grad_input = inputs.backward_get<float>();
    std::cout << "Gradient mapped back to " << grad_input.shape_str() << std::endl;

    // One deterministic pass, reusing the same batch buffers
    data_loading::BatchIterator it = dataset.iterate(example_constants::EVAL_BATCH_SIZE);
    size_t seen = 0;
    size_t batch_index = 0;
    while (it.next(batch)) {
      inputs.forward_put("bchw", batch.inputs);
      seen += inputs.n_sample();
      if (++batch_index % example_constants::PROGRESS_PRINT_INTERVAL == 0) {
        std::cout << "  batch " << batch_index << "/" << it.num_batches() << std::endl;
      }
    }
    std::cout << "Iterated " << seen << " samples in " << batch_index << " batches" << std::endl;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return -1;
  }

  return 0;
}
