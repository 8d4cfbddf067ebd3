// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raycasting.hpp
 *
 * Ring containment by horizontal ray crossing, then nearest edge.
 *
 * Zone segments listed consecutively form a polyline when each segment's
 * end equals the next segment's start. A polyline of at least three
 * segments whose last end equals its first start is a closed ring.
 *
 * Crossings use the half-open rule (a.y > p.y) != (b.y > p.y) with the ray
 * pointing towards +x. This is the same as lifting the ray by an
 * infinitesimal amount, so a ray through a vertex counts once.
 */

#ifndef ZONEMATCH_ALGORITHMS_RAYCASTING_HPP
#define ZONEMATCH_ALGORITHMS_RAYCASTING_HPP

#include <cstddef>
#include <vector>

#include "zonematch/types.hpp"

namespace zonematch {

/// Contiguous run of zone indices [first, last] forming a closed ring.
struct Ring {
  std::size_t first = 0;
  std::size_t last = 0;
};

/// Closed rings among consecutive zone segments.
std::vector<Ring> findRings(const ZoneList& zones);

/// Ray-crossing containment test. Points on an edge count as inside.
bool ringContains(const Ring& ring, const ZoneList& zones, const Point& point);

/**
 * @brief Raycasting correlation.
 *
 * A point inside a ring matches that ring's nearest edge at distance 0.
 * When rings are nested the ring with the closest edge wins. Points outside
 * every ring fall back to the nearest edge within cutoff among all zones.
 */
class Raycasting {
 public:
  /// Rings are derived from the zone order on every query.
  void build(const ZoneList& /*zones*/) {}

  void checkCutoff(double cutoff) const;
  void checkZones(const ZoneList& /*zones*/) const {}

  MatchResult correlate(const Point& point, const ZoneList& zones,
                        double cutoff) const;
};

}  // namespace zonematch

#endif  // ZONEMATCH_ALGORITHMS_RAYCASTING_HPP
