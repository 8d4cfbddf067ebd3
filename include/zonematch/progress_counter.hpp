// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef ZONEMATCH_PROGRESS_COUNTER_HPP
#define ZONEMATCH_PROGRESS_COUNTER_HPP

#include <atomic>
#include <cstddef>

namespace zonematch {

/// Monotonic count of processed addresses, readable while a batch runs.
class ProgressCounter {
 public:
  void add(std::size_t n = 1) noexcept {
    count_.fetch_add(n, std::memory_order_relaxed);
  }
  std::size_t value() const noexcept {
    return count_.load(std::memory_order_relaxed);
  }
  void reset() noexcept { count_.store(0, std::memory_order_relaxed); }

 private:
  std::atomic<std::size_t> count_{0};
};

}  // namespace zonematch

#endif  // ZONEMATCH_PROGRESS_COUNTER_HPP
