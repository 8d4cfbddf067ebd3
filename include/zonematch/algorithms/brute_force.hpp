// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * brute_force.hpp
 *
 * Linear scan over every zone. Reference result for the indexed algorithms.
 */

#ifndef ZONEMATCH_ALGORITHMS_BRUTE_FORCE_HPP
#define ZONEMATCH_ALGORITHMS_BRUTE_FORCE_HPP

#include "zonematch/types.hpp"

namespace zonematch {

class BruteForce {
 public:
  /// No index; kept for a uniform build/query lifecycle.
  void build(const ZoneList& /*zones*/) {}

  void checkCutoff(double cutoff) const;
  void checkZones(const ZoneList& /*zones*/) const {}

  MatchResult correlate(const Point& point, const ZoneList& zones,
                        double cutoff) const;
};

}  // namespace zonematch

#endif  // ZONEMATCH_ALGORITHMS_BRUTE_FORCE_HPP
