// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * kdtree.hpp
 *
 * 2-d tree over zone midpoints in local metric coordinates.
 */

#ifndef ZONEMATCH_ALGORITHMS_KDTREE_HPP
#define ZONEMATCH_ALGORITHMS_KDTREE_HPP

#include <Eigen/Core>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include <nanoflann.hpp>

#include "zonematch/config/algorithms.hpp"
#include "zonematch/geometry/geo_math.hpp"
#include "zonematch/types.hpp"

namespace zonematch {

/**
 * @brief Approximate nearest-zone search by segment midpoint.
 *
 * The k midpoints nearest to the query (within cutoff plus the longest
 * half-segment) are checked with the exact point-to-segment distance.
 * A zone whose midpoint is not among those k is never checked, so dense
 * zone sets with a small k can return a farther zone than the brute-force
 * scan.
 *
 * Search runs on a nanoflann index with leaves of up to leaf_size points.
 */
class KDTree {
 public:
  explicit KDTree(const config::KDTree& cfg = {});

  KDTree(const KDTree&) = delete;
  KDTree& operator=(const KDTree&) = delete;
  KDTree(KDTree&&) = default;
  KDTree& operator=(KDTree&&) = default;

  void build(const ZoneList& zones);

  void checkCutoff(double cutoff) const;

  /// @throws std::invalid_argument if zones differ in size from the index
  void checkZones(const ZoneList& zones) const;

  MatchResult correlate(const Point& point, const ZoneList& zones,
                        double cutoff) const;

  /// Up to k (distance_sq, zone_index) pairs nearest to a projected position
  /// within radius, sorted by distance.
  std::vector<std::pair<double, std::size_t>> nearestMidpoints(
      const Eigen::Vector2d& position, std::size_t k, double radius) const;

  /// Number of indexed midpoints (zones with finite coordinates).
  std::size_t size() const { return cloud_ ? cloud_->points.size() : 0; }
  std::size_t zoneCount() const { return zone_count_; }
  double maxHalfLength() const { return max_half_length_; }
  const geo::LocalProjection& projection() const { return projection_; }

 private:
  /// Projected midpoints [m] and the zone each one belongs to.
  struct MidpointCloud {
    std::vector<Eigen::Vector2d> points;
    std::vector<std::size_t> zone_ids;

    size_t kdtree_get_point_count() const { return points.size(); }
    double kdtree_get_pt(size_t idx, size_t dim) const { return points[idx](dim); }
    template <class BBOX>
    bool kdtree_get_bbox(BBOX&) const { return false; }
  };

  using MidpointIndex = nanoflann::KDTreeSingleIndexAdaptor<
      nanoflann::L2_Simple_Adaptor<double, MidpointCloud>, MidpointCloud, 2,
      uint32_t>;

  config::KDTree cfg_;
  geo::LocalProjection projection_;
  std::unique_ptr<MidpointCloud> cloud_;  // Stable address for index_
  std::unique_ptr<MidpointIndex> index_;
  double max_half_length_ = 0.0;
  std::size_t zone_count_ = 0;
};

}  // namespace zonematch

#endif  // ZONEMATCH_ALGORITHMS_KDTREE_HPP
