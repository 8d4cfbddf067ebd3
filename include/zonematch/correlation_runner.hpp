// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * correlation_runner.hpp
 *
 * Batch correlation of addresses against zones.
 */

#ifndef ZONEMATCH_CORRELATION_RUNNER_HPP
#define ZONEMATCH_CORRELATION_RUNNER_HPP

#include <cstddef>
#include <memory>
#include <vector>

#include "zonematch/algorithms/correlation_algorithm.hpp"
#include "zonematch/config/zonematch.hpp"
#include "zonematch/progress_counter.hpp"
#include "zonematch/types.hpp"

namespace zonematch {

/// Results of one batch. results[i] belongs to addresses[i].
struct CorrelationBatch {
  std::vector<MatchResult> results;
  std::size_t failures = 0;  ///< Addresses whose query threw

  std::size_t matched() const;
};

/**
 * @brief Runs one algorithm over an address batch in parallel.
 *
 * Each worker writes only its own result slot. A query that throws (for
 * example on a non-finite coordinate) leaves nullopt in that slot and is
 * counted in CorrelationBatch::failures; the rest of the batch continues.
 */
class CorrelationRunner {
 public:
  explicit CorrelationRunner(const config::Correlation& cfg = {});

  void setProgressCounter(std::shared_ptr<ProgressCounter> progress) {
    progress_ = std::move(progress);
  }

  /**
   * @brief Correlate every address with the configured cutoff.
   *
   * @param algorithm Built algorithm (build() already called with zones)
   * @throws std::invalid_argument on an unusable cutoff or a zone list that
   *         does not match the built index, before any query runs
   */
  CorrelationBatch run(const AddressList& addresses, const ZoneList& zones,
                       const CorrelationAlgorithm& algorithm) const;

  /// Resolved worker count (num_threads == 0 -> all cores).
  int threadCount() const;

  const config::Correlation& config() const { return cfg_; }

 private:
  CorrelationBatch runChunked(const AddressList& addresses,
                              const ZoneList& zones,
                              const OverlappingChunks& chunks) const;

  config::Correlation cfg_;
  std::shared_ptr<ProgressCounter> progress_;
};

}  // namespace zonematch

#endif  // ZONEMATCH_CORRELATION_RUNNER_HPP
