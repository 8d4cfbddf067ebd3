// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "zonematch/algorithms/brute_force.hpp"

#include "zonematch/geometry/geo_math.hpp"
#include "zonematch/geometry/nearest_match.hpp"

namespace zonematch {

void BruteForce::checkCutoff(double cutoff) const {
  geo::validateCutoff(cutoff);
}

MatchResult BruteForce::correlate(const Point& point, const ZoneList& zones,
                                  double cutoff) const {
  checkCutoff(cutoff);
  geo::validateQueryPoint(point);

  const Eigen::Vector2d p = point.toVector();
  NearestMatch best(cutoff);
  for (std::size_t i = 0; i < zones.size(); ++i) {
    const auto& zone = zones[i];
    best.offer(i, geo::pointToSegmentDistance(p, zone.start().toVector(),
                                              zone.end().toVector()));
  }
  return best.result();
}

}  // namespace zonematch
