// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * correlation_runner.cpp
 *
 * OpenMP batch loop with per-address failure isolation.
 */

#include "zonematch/correlation_runner.hpp"

#include <omp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <numeric>

namespace zonematch {

std::size_t CorrelationBatch::matched() const {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(),
                    [](const MatchResult& r) { return r.has_value(); }));
}

CorrelationRunner::CorrelationRunner(const config::Correlation& cfg)
    : cfg_(cfg) {}

int CorrelationRunner::threadCount() const {
  return cfg_.num_threads > 0 ? cfg_.num_threads : omp_get_max_threads();
}

CorrelationBatch CorrelationRunner::run(
    const AddressList& addresses, const ZoneList& zones,
    const CorrelationAlgorithm& algorithm) const {
  algorithm.checkCutoff(cfg_.cutoff);
  algorithm.checkZones(zones);

  if (const auto* chunks =
          std::get_if<OverlappingChunks>(&algorithm.strategy())) {
    return runChunked(addresses, zones, *chunks);
  }

  CorrelationBatch batch;
  batch.results.resize(addresses.size());
  std::vector<uint8_t> failed(addresses.size(), 0);

  const int n = static_cast<int>(addresses.size());
  const double cutoff = cfg_.cutoff;
  ProgressCounter* progress = progress_.get();

#pragma omp parallel for num_threads(threadCount()) schedule(dynamic, 64)
  for (int i = 0; i < n; ++i) {
    try {
      batch.results[i] = algorithm.correlate(addresses[i].point, zones, cutoff);
    } catch (const std::exception& e) {
      failed[i] = 1;
      spdlog::debug("[Runner] Address {} ({} {}) failed: {}", i,
                    addresses[i].street, addresses[i].number, e.what());
    }
    if (progress) progress->add();
  }

  batch.failures = std::accumulate(failed.begin(), failed.end(), size_t{0});
  if (batch.failures > 0) {
    spdlog::warn("[Runner] {} of {} addresses failed ({})", batch.failures,
                 addresses.size(), algorithm.name());
  }
  spdlog::debug("[Runner] {}: {} of {} addresses matched", algorithm.name(),
                batch.matched(), addresses.size());
  return batch;
}

CorrelationBatch CorrelationRunner::runChunked(
    const AddressList& addresses, const ZoneList& zones,
    const OverlappingChunks& chunks) const {
  std::vector<Point> points;
  points.reserve(addresses.size());
  for (const auto& address : addresses) points.push_back(address.point);

  std::vector<uint8_t> failed;
  CorrelationBatch batch;
  batch.results = chunks.correlateAll(points, zones, cfg_.cutoff,
                                      threadCount(), &failed, progress_.get());

  batch.failures = std::accumulate(failed.begin(), failed.end(), size_t{0});
  if (batch.failures > 0) {
    spdlog::warn("[Runner] {} of {} addresses failed (overlapping_chunks)",
                 batch.failures, addresses.size());
  }
  return batch;
}

}  // namespace zonematch
