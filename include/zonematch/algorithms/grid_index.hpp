// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_index.hpp
 *
 * Fixed-size cell index over zone segments.
 */

#ifndef ZONEMATCH_ALGORITHMS_GRID_INDEX_HPP
#define ZONEMATCH_ALGORITHMS_GRID_INDEX_HPP

#include <cstddef>
#include <vector>

#include "zonematch/config/algorithms.hpp"
#include "zonematch/geometry/cell_hash.hpp"
#include "zonematch/types.hpp"

namespace zonematch {

/**
 * @brief Zone lookup by grid cell.
 *
 * Build registers every zone once in each cell its segment crosses. A query
 * checks the (2 * neighbor_radius + 1)^2 cells around the point.
 *
 * Zones outside the searched block are never seen, so results match the
 * brute-force scan only while cutoff <= cell_size * neighbor_radius.
 */
class GridIndex {
 public:
  /// @throws std::invalid_argument if cell_size is not finite and positive
  explicit GridIndex(const config::Grid& cfg = {});

  void build(const ZoneList& zones);

  void checkCutoff(double cutoff) const;

  /// @throws std::invalid_argument if zones differ in size from the index
  void checkZones(const ZoneList& zones) const;

  MatchResult correlate(const Point& point, const ZoneList& zones,
                        double cutoff) const;

  /// Zone indices registered in a cell (empty when the cell is unused).
  const std::vector<std::size_t>& cellZones(const Cell& cell) const;

  std::size_t cellCount() const { return cells_.size(); }
  std::size_t zoneCount() const { return zone_count_; }
  const config::Grid& config() const { return cfg_; }

 private:
  config::Grid cfg_;
  CellMap<std::vector<std::size_t>> cells_;
  std::size_t zone_count_ = 0;
};

}  // namespace zonematch

#endif  // ZONEMATCH_ALGORITHMS_GRID_INDEX_HPP
