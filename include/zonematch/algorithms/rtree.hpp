// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rtree.hpp
 *
 * Sort-Tile-Recursive bulk-loaded R-tree over zone bounding boxes.
 */

#ifndef ZONEMATCH_ALGORITHMS_RTREE_HPP
#define ZONEMATCH_ALGORITHMS_RTREE_HPP

#include <Eigen/Core>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "zonematch/config/algorithms.hpp"
#include "zonematch/types.hpp"

namespace zonematch {

/// Axis-aligned box in degrees.
struct BoundingBox {
  Eigen::Vector2d min = Eigen::Vector2d::Constant(
      std::numeric_limits<double>::infinity());
  Eigen::Vector2d max = Eigen::Vector2d::Constant(
      -std::numeric_limits<double>::infinity());

  void extend(const Eigen::Vector2d& p) {
    min = min.cwiseMin(p);
    max = max.cwiseMax(p);
  }
  void extend(const BoundingBox& other) {
    min = min.cwiseMin(other.min);
    max = max.cwiseMax(other.max);
  }
  bool intersects(const BoundingBox& other) const {
    return (min.array() <= other.max.array()).all() &&
           (other.min.array() <= max.array()).all();
  }
  Eigen::Vector2d center() const { return 0.5 * (min + max); }
};

/**
 * @brief R-tree with expanding-box queries.
 *
 * A query searches boxes of cutoff/8, cutoff/4, cutoff/2 and cutoff around
 * the point and stops at the first box whose radius covers the best match
 * found so far. Every zone closer than that radius intersects the box, so
 * the result is exact.
 */
class RTree {
 public:
  explicit RTree(const config::RTree& cfg = {});

  void build(const ZoneList& zones);

  void checkCutoff(double cutoff) const;

  /// @throws std::invalid_argument if zones differ in size from the index
  void checkZones(const ZoneList& zones) const;

  MatchResult correlate(const Point& point, const ZoneList& zones,
                        double cutoff) const;

  /// Zone indices whose bounding box intersects the query box.
  std::vector<std::size_t> search(const BoundingBox& box) const;

  std::size_t nodeCount() const { return nodes_.size(); }
  std::size_t zoneCount() const { return zone_count_; }
  int height() const { return height_; }

 private:
  struct Entry {
    BoundingBox box;
    std::size_t zone_index = 0;
  };

  struct Node {
    BoundingBox box;
    uint32_t first = 0;  ///< First child in nodes_ (or entries_ for leaves)
    uint32_t count = 0;
    bool leaf = true;
  };

  config::RTree cfg_;
  std::vector<Entry> entries_;  ///< Leaf payload, tile order
  std::vector<Node> nodes_;
  int32_t root_ = -1;
  int height_ = 0;
  std::size_t zone_count_ = 0;
};

}  // namespace zonematch

#endif  // ZONEMATCH_ALGORITHMS_RTREE_HPP
