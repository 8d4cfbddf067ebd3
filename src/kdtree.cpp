// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * kdtree.cpp
 *
 * nanoflann index over projected zone midpoints.
 */

#include "zonematch/algorithms/kdtree.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "zonematch/geometry/nearest_match.hpp"

namespace zonematch {

namespace {

// Widens the midpoint search radius to absorb the difference between the
// local projection and haversine distances.
constexpr double kRadiusSlack = 1.05;

}  // namespace

KDTree::KDTree(const config::KDTree& cfg) : cfg_(cfg) {}

void KDTree::build(const ZoneList& zones) {
  index_.reset();
  cloud_.reset();
  zone_count_ = zones.size();
  max_half_length_ = 0.0;

  double latitude_sum = 0.0;
  size_t valid = 0;
  for (const auto& zone : zones) {
    if (!zone.isValid()) continue;
    latitude_sum += 0.5 * (zone.start().toVector().y() + zone.end().toVector().y());
    ++valid;
  }
  projection_ = geo::LocalProjection(valid > 0 ? latitude_sum / valid : 0.0);

  if (valid < zones.size()) {
    spdlog::warn("[KDTree] Skipped {} zones with non-finite coordinates",
                 zones.size() - valid);
  }
  if (valid == 0) return;

  cloud_ = std::make_unique<MidpointCloud>();
  cloud_->points.reserve(valid);
  cloud_->zone_ids.reserve(valid);
  for (size_t i = 0; i < zones.size(); ++i) {
    if (!zones[i].isValid()) continue;
    const Eigen::Vector2d a = projection_.project(zones[i].start().toVector());
    const Eigen::Vector2d b = projection_.project(zones[i].end().toVector());
    cloud_->points.push_back(0.5 * (a + b));
    cloud_->zone_ids.push_back(i);
    max_half_length_ = std::max(max_half_length_, 0.5 * (b - a).norm());
  }

  const auto leaf_size = static_cast<size_t>(std::max(cfg_.leaf_size, 1));
  index_ = std::make_unique<MidpointIndex>(
      2, *cloud_, nanoflann::KDTreeSingleIndexAdaptorParams(leaf_size));

  spdlog::debug("[KDTree] Indexed {} midpoints (max half-length {:.1f} m)",
                cloud_->points.size(), max_half_length_);
}

std::vector<std::pair<double, std::size_t>> KDTree::nearestMidpoints(
    const Eigen::Vector2d& position, std::size_t k, double radius) const {
  std::vector<std::pair<double, std::size_t>> out;
  if (!index_ || k == 0) return out;

  k = std::min(k, size());
  std::vector<uint32_t> indices(k);
  std::vector<double> dists_sq(k);

  nanoflann::KNNResultSet<double, uint32_t> result_set(k);
  result_set.init(indices.data(), dists_sq.data());
  index_->findNeighbors(result_set, position.data());

  // Results arrive sorted by distance
  const double radius_sq = radius * radius;
  const size_t found = result_set.size();
  out.reserve(found);
  for (size_t i = 0; i < found; ++i) {
    if (dists_sq[i] > radius_sq) break;
    out.emplace_back(dists_sq[i], cloud_->zone_ids[indices[i]]);
  }
  return out;
}

void KDTree::checkCutoff(double cutoff) const {
  geo::validateCutoff(cutoff);
}

void KDTree::checkZones(const ZoneList& zones) const {
  geo::validateZoneCount(zone_count_, zones.size());
}

MatchResult KDTree::correlate(const Point& point, const ZoneList& zones,
                              double cutoff) const {
  checkCutoff(cutoff);
  checkZones(zones);
  geo::validateQueryPoint(point);

  const Eigen::Vector2d lonlat = point.toVector();
  const double radius = (cutoff + max_half_length_) * kRadiusSlack;
  const auto candidates = nearestMidpoints(projection_.project(lonlat),
                                           static_cast<size_t>(cfg_.k), radius);

  NearestMatch best(cutoff);
  for (const auto& [d2, zone_index] : candidates) {
    const auto& zone = zones[zone_index];
    best.offer(zone_index,
               geo::pointToSegmentDistance(lonlat, zone.start().toVector(),
                                           zone.end().toVector()));
  }
  return best.result();
}

}  // namespace zonematch
