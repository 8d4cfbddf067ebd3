// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_index.cpp
 *
 * Cell index build (segment traversal) and block query.
 */

#include "zonematch/algorithms/grid_index.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <string>

#include "zonematch/geometry/geo_math.hpp"
#include "zonematch/geometry/nearest_match.hpp"

namespace zonematch {

GridIndex::GridIndex(const config::Grid& cfg) : cfg_(cfg) {
  if (!(cfg_.cell_size > 0.0) || !std::isfinite(cfg_.cell_size)) {
    throw std::invalid_argument("grid.cell_size must be finite and > 0, got " +
                                std::to_string(cfg_.cell_size));
  }
}

void GridIndex::build(const ZoneList& zones) {
  cells_.clear();
  zone_count_ = zones.size();

  size_t skipped = 0;
  size_t entries = 0;
  for (size_t i = 0; i < zones.size(); ++i) {
    const auto& zone = zones[i];
    if (!zone.isValid()) {
      ++skipped;
      continue;
    }
    // segmentCells yields each cell once, so a zone appears once per cell
    for (const auto& cell :
         geo::segmentCells(zone.start(), zone.end(), cfg_.cell_size)) {
      cells_[cell].push_back(i);
      ++entries;
    }
  }

  if (skipped > 0) {
    spdlog::warn("[GridIndex] Skipped {} zones with non-finite coordinates",
                 skipped);
  }
  spdlog::debug("[GridIndex] Indexed {} zones into {} cells ({} entries)",
                zones.size() - skipped, cells_.size(), entries);
}

void GridIndex::checkCutoff(double cutoff) const {
  geo::validateCutoff(cutoff);
}

void GridIndex::checkZones(const ZoneList& zones) const {
  geo::validateZoneCount(zone_count_, zones.size());
}

MatchResult GridIndex::correlate(const Point& point, const ZoneList& zones,
                                 double cutoff) const {
  checkCutoff(cutoff);
  checkZones(zones);
  geo::validateQueryPoint(point);

  const Eigen::Vector2d p = point.toVector();
  const Cell center = geo::gridCell(p, cfg_.cell_size);

  NearestMatch best(cutoff);
  for (const auto& cell : geo::neighborCells(center, cfg_.neighbor_radius)) {
    auto it = cells_.find(cell);
    if (it == cells_.end()) continue;
    for (size_t zone_index : it->second) {
      const auto& zone = zones[zone_index];
      best.offer(zone_index,
                 geo::pointToSegmentDistance(p, zone.start().toVector(),
                                             zone.end().toVector()));
    }
  }
  return best.result();
}

const std::vector<std::size_t>& GridIndex::cellZones(const Cell& cell) const {
  static const std::vector<std::size_t> kEmpty;
  auto it = cells_.find(cell);
  return it == cells_.end() ? kEmpty : it->second;
}

}  // namespace zonematch
