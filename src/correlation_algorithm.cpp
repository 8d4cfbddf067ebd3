// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "zonematch/algorithms/correlation_algorithm.hpp"

#include <stdexcept>
#include <utility>

namespace zonematch {

CorrelationAlgorithm::CorrelationAlgorithm(Strategy strategy)
    : strategy_(std::move(strategy)) {}

CorrelationAlgorithm CorrelationAlgorithm::create(
    AlgorithmType type, const config::Algorithms& params) {
  switch (type) {
    case AlgorithmType::BruteForce:
      return CorrelationAlgorithm(BruteForce{});
    case AlgorithmType::Raycasting:
      return CorrelationAlgorithm(Raycasting{});
    case AlgorithmType::Grid:
      return CorrelationAlgorithm(GridIndex(params.grid));
    case AlgorithmType::OverlappingChunks:
      return CorrelationAlgorithm(OverlappingChunks(params.chunks));
    case AlgorithmType::KDTree:
      return CorrelationAlgorithm(KDTree(params.kdtree));
    case AlgorithmType::RTree:
      return CorrelationAlgorithm(RTree(params.rtree));
  }
  throw std::invalid_argument("Unknown algorithm type");
}

void CorrelationAlgorithm::build(const ZoneList& zones) {
  std::visit([&](auto& s) { s.build(zones); }, strategy_);
}

void CorrelationAlgorithm::checkCutoff(double cutoff) const {
  std::visit([&](const auto& s) { s.checkCutoff(cutoff); }, strategy_);
}

void CorrelationAlgorithm::checkZones(const ZoneList& zones) const {
  std::visit([&](const auto& s) { s.checkZones(zones); }, strategy_);
}

MatchResult CorrelationAlgorithm::correlate(const Point& point,
                                            const ZoneList& zones,
                                            double cutoff) const {
  return std::visit(
      [&](const auto& s) { return s.correlate(point, zones, cutoff); },
      strategy_);
}

AlgorithmType CorrelationAlgorithm::type() const {
  return static_cast<AlgorithmType>(strategy_.index());
}

}  // namespace zonematch
