// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef ZONEMATCH_ALGORITHMS_CORRELATION_ALGORITHM_HPP
#define ZONEMATCH_ALGORITHMS_CORRELATION_ALGORITHM_HPP

#include <memory>
#include <variant>

#include "zonematch/algorithms/brute_force.hpp"
#include "zonematch/algorithms/grid_index.hpp"
#include "zonematch/algorithms/kdtree.hpp"
#include "zonematch/algorithms/overlapping_chunks.hpp"
#include "zonematch/algorithms/raycasting.hpp"
#include "zonematch/algorithms/rtree.hpp"
#include "zonematch/config/algorithms.hpp"
#include "zonematch/types.hpp"

namespace zonematch {

/// Nearest-zone search with a selectable strategy.
/// Lifecycle: build(zones) once, then correlate() any number of times with
/// the same zone list. Queries are const and safe to run concurrently.
class CorrelationAlgorithm {
 public:
  /// Alternatives are listed in AlgorithmType order.
  using Strategy = std::variant<BruteForce, Raycasting, GridIndex,
                                OverlappingChunks, KDTree, RTree>;

  explicit CorrelationAlgorithm(Strategy strategy);

  static CorrelationAlgorithm create(AlgorithmType type,
                                     const config::Algorithms& params = {});

  /// Build the spatial index. Replaces any previous index.
  void build(const ZoneList& zones);

  /// @throws std::invalid_argument if the cutoff is unusable for this strategy
  void checkCutoff(double cutoff) const;

  /// @throws std::invalid_argument if zones differ from the indexed list size
  void checkZones(const ZoneList& zones) const;

  /**
   * @brief Nearest zone within cutoff.
   *
   * @return zone index and distance [m], or nullopt if nothing is in range
   * @throws std::invalid_argument on a bad cutoff or zone list
   * @throws std::domain_error on a non-finite query point
   */
  MatchResult correlate(const Point& point, const ZoneList& zones,
                        double cutoff) const;

  AlgorithmType type() const;
  const char* name() const { return algorithmName(type()); }

  const Strategy& strategy() const { return strategy_; }

 private:
  Strategy strategy_;
};

inline std::unique_ptr<CorrelationAlgorithm> createCorrelationAlgorithm(
    AlgorithmType type, const config::Algorithms& params = {}) {
  return std::make_unique<CorrelationAlgorithm>(
      CorrelationAlgorithm::create(type, params));
}

}  // namespace zonematch

#endif  // ZONEMATCH_ALGORITHMS_CORRELATION_ALGORITHM_HPP
