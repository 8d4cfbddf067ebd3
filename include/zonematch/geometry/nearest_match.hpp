// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef ZONEMATCH_GEOMETRY_NEAREST_MATCH_HPP
#define ZONEMATCH_GEOMETRY_NEAREST_MATCH_HPP

#include <cstddef>

#include "zonematch/types.hpp"

namespace zonematch {

/**
 * @brief Running minimum over (zone_index, distance) candidates.
 *
 * Candidates farther than the cutoff are ignored. On equal distance the
 * lower zone index wins, so the result does not depend on the order in
 * which an index yields its candidates.
 */
class NearestMatch {
 public:
  explicit NearestMatch(double cutoff) : cutoff_(cutoff) {}

  void offer(std::size_t zone_index, double distance) {
    if (!(distance <= cutoff_)) return;  // also rejects NaN
    if (!found_ || distance < best_.distance ||
        (distance == best_.distance && zone_index < best_.zone_index)) {
      best_ = Match{zone_index, distance};
      found_ = true;
    }
  }

  void merge(const MatchResult& other) {
    if (other) offer(other->zone_index, other->distance);
  }

  /// Distance a new candidate has to beat: best so far, else the cutoff.
  double bound() const { return found_ ? best_.distance : cutoff_; }

  bool found() const { return found_; }

  MatchResult result() const {
    if (!found_) return std::nullopt;
    return best_;
  }

 private:
  double cutoff_;
  Match best_;
  bool found_ = false;
};

}  // namespace zonematch

#endif  // ZONEMATCH_GEOMETRY_NEAREST_MATCH_HPP
