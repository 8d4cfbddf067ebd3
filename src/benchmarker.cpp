// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "zonematch/benchmarker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

#include "zonematch/algorithms/correlation_algorithm.hpp"
#include "zonematch/correlation_runner.hpp"
#include "zonematch/geometry/geo_math.hpp"

namespace zonematch {

namespace {

template <typename Fn>
double timeMs(Fn&& fn) {
  const auto start = std::chrono::steady_clock::now();
  fn();
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

Benchmarker::Benchmarker(const Config& cfg) : cfg_(cfg) {}

BenchmarkReport Benchmarker::run(const AddressList& addresses,
                                 const ZoneList& zones) const {
  return run(addresses, zones, cfg_.correlation.cutoff,
             cfg_.benchmark.algorithms,
             static_cast<std::size_t>(std::max(cfg_.benchmark.sample_size, 0)));
}

BenchmarkReport Benchmarker::run(const AddressList& addresses,
                                 const ZoneList& zones, double cutoff,
                                 const std::vector<AlgorithmType>& algorithms,
                                 std::size_t sample_size) const {
  geo::validateCutoff(cutoff);

  BenchmarkReport report;
  report.requested_sample_size = sample_size;
  report.sample_size = std::min(sample_size, addresses.size());
  if (report.clamped()) {
    spdlog::warn("[Benchmark] Requested {} addresses, only {} available",
                 sample_size, addresses.size());
  }

  const AddressList sample(addresses.begin(),
                           addresses.begin() + report.sample_size);

  config::Correlation run_cfg = cfg_.correlation;
  run_cfg.cutoff = cutoff;
  const CorrelationRunner runner(run_cfg);

  // Chunks reject a cutoff above their margin
  config::Algorithms params = cfg_.algorithms;
  params.chunks.overlap_margin = std::max(params.chunks.overlap_margin, cutoff);

  for (AlgorithmType type : algorithms) {
    BenchmarkSample s;
    s.type = type;
    s.algorithm = algorithmName(type);
    s.addresses_tested = sample.size();

    auto algorithm = CorrelationAlgorithm::create(type, params);
    s.build_ms = timeMs([&] { algorithm.build(zones); });

    CorrelationBatch batch;
    s.total_query_ms = timeMs([&] { batch = runner.run(sample, zones, algorithm); });
    s.avg_query_us = sample.empty()
                         ? 0.0
                         : s.total_query_ms * 1000.0 /
                               static_cast<double>(sample.size());
    s.matches_found = batch.matched();
    s.failures = batch.failures;

    spdlog::info("[Benchmark] {}: build {:.2f} ms, query {:.2f} ms, {} matches",
                 s.algorithm, s.build_ms, s.total_query_ms, s.matches_found);
    report.samples.push_back(std::move(s));
  }

  std::stable_sort(report.samples.begin(), report.samples.end(),
                   [](const BenchmarkSample& a, const BenchmarkSample& b) {
                     return a.totalMs() < b.totalMs();
                   });
  for (size_t i = 0; i < report.samples.size(); ++i) {
    report.samples[i].rank = i + 1;
  }
  return report;
}

}  // namespace zonematch
