// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raycasting.cpp
 *
 * Ring containment for zone boundaries.
 *
 * Algorithm:
 * 1. Split the zone list into chains of segments joined end-to-start
 * 2. Keep chains that close on themselves as rings
 * 3. Count crossings of a +x ray with each ring's edges
 * 4. Odd count (or a point on an edge) = inside: nearest edge of the ring
 *    at distance 0
 * 5. Outside every ring: nearest edge among all zones within cutoff
 */

#include "zonematch/algorithms/raycasting.hpp"

#include <limits>

#include "zonematch/geometry/geo_math.hpp"
#include "zonematch/geometry/nearest_match.hpp"

namespace zonematch {

namespace {

// Minimum segments for a closed ring
constexpr std::size_t kMinRingEdges = 3;
// Edge distance [m] treated as lying on the boundary
constexpr double kBoundaryTolerance = 1e-6;

/**
 * @brief Whether the +x ray from p crosses edge (a, b).
 *
 * The y test runs on exact decimals so shared vertices are classified the
 * same way for both edges that meet there.
 */
bool crossesRay(const Point& a, const Point& b, const Point& p) {
  if ((a.y() > p.y()) == (b.y() > p.y())) return false;

  const Eigen::Vector2d va = a.toVector();
  const Eigen::Vector2d vb = b.toVector();
  const Eigen::Vector2d vp = p.toVector();
  const double x_cross =
      va.x() + (vp.y() - va.y()) * (vb.x() - va.x()) / (vb.y() - va.y());
  return vp.x() < x_cross;
}

}  // namespace

std::vector<Ring> findRings(const ZoneList& zones) {
  std::vector<Ring> rings;
  std::size_t first = 0;
  while (first < zones.size()) {
    std::size_t last = first;
    while (last + 1 < zones.size() &&
           zones[last].end() == zones[last + 1].start()) {
      ++last;
    }

    const std::size_t edges = last - first + 1;
    if (edges >= kMinRingEdges && zones[last].end() == zones[first].start()) {
      rings.push_back(Ring{first, last});
    }
    first = last + 1;
  }
  return rings;
}

bool ringContains(const Ring& ring, const ZoneList& zones, const Point& point) {
  const Eigen::Vector2d p = point.toVector();
  bool inside = false;
  for (std::size_t i = ring.first; i <= ring.last; ++i) {
    const auto& edge = zones[i];
    if (geo::pointToSegmentDistance(p, edge.start().toVector(),
                                    edge.end().toVector()) <=
        kBoundaryTolerance) {
      return true;
    }
    if (crossesRay(edge.start(), edge.end(), point)) inside = !inside;
  }
  return inside;
}

void Raycasting::checkCutoff(double cutoff) const {
  geo::validateCutoff(cutoff);
}

MatchResult Raycasting::correlate(const Point& point, const ZoneList& zones,
                                  double cutoff) const {
  checkCutoff(cutoff);
  geo::validateQueryPoint(point);

  const Eigen::Vector2d p = point.toVector();
  auto edgeDistance = [&](std::size_t i) {
    return geo::pointToSegmentDistance(p, zones[i].start().toVector(),
                                       zones[i].end().toVector());
  };

  // Among containing rings, the one with the closest edge wins (innermost
  // for nested rings). The match itself is reported at distance 0.
  NearestMatch containing(std::numeric_limits<double>::infinity());
  for (const auto& ring : findRings(zones)) {
    if (!ringContains(ring, zones, point)) continue;
    for (std::size_t i = ring.first; i <= ring.last; ++i) {
      containing.offer(i, edgeDistance(i));
    }
  }
  if (auto inside = containing.result()) {
    return Match{inside->zone_index, 0.0};
  }

  NearestMatch best(cutoff);
  for (std::size_t i = 0; i < zones.size(); ++i) {
    best.offer(i, edgeDistance(i));
  }
  return best.result();
}

}  // namespace zonematch
