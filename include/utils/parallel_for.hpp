/*
 * Copyright (c) 2025 Tung D. Pham
 *
 * This software is licensed under the MIT License. See the LICENSE file in the
 * project root for the full license text.
 */

#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>

#ifdef USE_TBB
#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>
#endif

#ifdef _OPENMP
#include <omp.h>
#endif

namespace utils {

template <typename Index = size_t, typename Func>
inline void parallel_for(const Index begin, const Index end, Func f) {
  if (end <= begin)
    return;
#if defined(_OPENMP)
#pragma omp parallel for schedule(static)
  for (Index i = begin; i < end; ++i) {
    f(i);
  }
#elif defined(USE_TBB)
  tbb::parallel_for(
      tbb::blocked_range<Index>(begin, end),
      [&](const tbb::blocked_range<Index> &r) {
        for (Index i = r.begin(); i != r.end(); ++i)
          f(i);
      },
      tbb::static_partitioner());
#else
  for (Index i = begin; i < end; ++i)
    f(i);
#endif
}

/**
 * Like parallel_for, but exceptions thrown by `f` do not escape the worker threads.
 * The first one is captured and rethrown on the calling thread once every
 * iteration has finished.
 */
template <typename Index = size_t, typename Func>
inline void parallel_for_rethrow(const Index begin, const Index end, Func f) {
  std::exception_ptr first_error;
  std::mutex error_mutex;
  parallel_for<Index>(begin, end, [&](Index i) {
    try {
      f(i);
    } catch (...) {
      std::lock_guard<std::mutex> lock(error_mutex);
      if (!first_error) {
        first_error = std::current_exception();
      }
    }
  });
  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

} // namespace utils
