// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * benchmarker.hpp
 *
 * Build and query timing for correlation algorithms.
 */

#ifndef ZONEMATCH_BENCHMARKER_HPP
#define ZONEMATCH_BENCHMARKER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "zonematch/config/zonematch.hpp"
#include "zonematch/types.hpp"

namespace zonematch {

/// Timing of one algorithm over the sampled addresses.
struct BenchmarkSample {
  std::string algorithm;
  AlgorithmType type = AlgorithmType::BruteForce;
  double build_ms = 0.0;
  double total_query_ms = 0.0;
  double avg_query_us = 0.0;  ///< total_query_ms / addresses_tested
  std::size_t matches_found = 0;
  std::size_t addresses_tested = 0;
  std::size_t failures = 0;
  std::size_t rank = 0;  ///< 1 = fastest

  double totalMs() const { return build_ms + total_query_ms; }
};

/// Samples ordered by total time, fastest first.
struct BenchmarkReport {
  std::vector<BenchmarkSample> samples;
  std::size_t requested_sample_size = 0;
  std::size_t sample_size = 0;  ///< After clamping to available addresses

  bool clamped() const { return sample_size < requested_sample_size; }
  const BenchmarkSample* fastest() const {
    return samples.empty() ? nullptr : &samples.front();
  }
};

/**
 * @brief Times each algorithm on the first sample_size addresses.
 *
 * Every algorithm is built from scratch (timed), then queried through the
 * CorrelationRunner (timed). Inputs are read only.
 */
class Benchmarker {
 public:
  explicit Benchmarker(const Config& cfg = {});

  /// Cutoff, algorithms and sample size from the configuration.
  BenchmarkReport run(const AddressList& addresses, const ZoneList& zones) const;

  /// A sample size above addresses.size() is clamped with a warning.
  /// @throws std::invalid_argument on an unusable cutoff
  BenchmarkReport run(const AddressList& addresses, const ZoneList& zones,
                      double cutoff,
                      const std::vector<AlgorithmType>& algorithms,
                      std::size_t sample_size) const;

 private:
  Config cfg_;
};

}  // namespace zonematch

#endif  // ZONEMATCH_BENCHMARKER_HPP
