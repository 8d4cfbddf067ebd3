// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rtree.cpp
 *
 * STR bulk loading and expanding-box nearest search.
 *
 * Bulk load, per level:
 * 1. Sort items by box center x, cut into ceil(sqrt(n / M)) vertical slices
 * 2. Sort each slice by center y
 * 3. Pack consecutive runs of M items into one parent node
 */

#include "zonematch/algorithms/rtree.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

#include "zonematch/geometry/geo_math.hpp"
#include "zonematch/geometry/nearest_match.hpp"

namespace zonematch {

namespace {

// Query box radii as fractions of the cutoff, searched in order
constexpr double kSearchSteps[] = {0.125, 0.25, 0.5, 1.0};

/// Reorder items into Sort-Tile-Recursive order for node capacity M.
template <typename T, typename BoxOf>
void sortTileRecursive(std::vector<T>& items, size_t capacity, BoxOf box_of) {
  const size_t n = items.size();
  if (n <= capacity) return;

  const auto leaf_count = static_cast<size_t>(
      std::ceil(static_cast<double>(n) / static_cast<double>(capacity)));
  const auto slice_count = static_cast<size_t>(
      std::ceil(std::sqrt(static_cast<double>(leaf_count))));
  const size_t slice_size = slice_count * capacity;

  std::sort(items.begin(), items.end(), [&](const T& a, const T& b) {
    return box_of(a).center().x() < box_of(b).center().x();
  });
  for (size_t begin = 0; begin < n; begin += slice_size) {
    const size_t end = std::min(begin + slice_size, n);
    std::sort(items.begin() + begin, items.begin() + end,
              [&](const T& a, const T& b) {
                return box_of(a).center().y() < box_of(b).center().y();
              });
  }
}

}  // namespace

RTree::RTree(const config::RTree& cfg) : cfg_(cfg) {}

void RTree::build(const ZoneList& zones) {
  entries_.clear();
  nodes_.clear();
  root_ = -1;
  height_ = 0;
  zone_count_ = zones.size();

  entries_.reserve(zones.size());
  for (size_t i = 0; i < zones.size(); ++i) {
    if (!zones[i].isValid()) continue;
    Entry entry;
    entry.box.extend(zones[i].start().toVector());
    entry.box.extend(zones[i].end().toVector());
    entry.zone_index = i;
    entries_.push_back(entry);
  }
  if (entries_.size() < zones.size()) {
    spdlog::warn("[RTree] Skipped {} zones with non-finite coordinates",
                 zones.size() - entries_.size());
  }
  if (entries_.empty()) return;

  const size_t capacity = static_cast<size_t>(std::max(cfg_.max_entries, 2));

  // Leaves over the entry array
  sortTileRecursive(entries_, capacity,
                    [](const Entry& e) -> const BoundingBox& { return e.box; });
  std::vector<Node> level;
  for (size_t begin = 0; begin < entries_.size(); begin += capacity) {
    const size_t end = std::min(begin + capacity, entries_.size());
    Node leaf;
    leaf.first = static_cast<uint32_t>(begin);
    leaf.count = static_cast<uint32_t>(end - begin);
    leaf.leaf = true;
    for (size_t i = begin; i < end; ++i) leaf.box.extend(entries_[i].box);
    level.push_back(leaf);
  }
  height_ = 1;

  // Upper levels: tile the current level, store it, then pack parents
  while (level.size() > 1) {
    sortTileRecursive(level, capacity,
                      [](const Node& n) -> const BoundingBox& { return n.box; });
    const size_t base = nodes_.size();
    nodes_.insert(nodes_.end(), level.begin(), level.end());

    std::vector<Node> parents;
    for (size_t begin = 0; begin < level.size(); begin += capacity) {
      const size_t end = std::min(begin + capacity, level.size());
      Node parent;
      parent.first = static_cast<uint32_t>(base + begin);
      parent.count = static_cast<uint32_t>(end - begin);
      parent.leaf = false;
      for (size_t i = begin; i < end; ++i) parent.box.extend(level[i].box);
      parents.push_back(parent);
    }
    level = std::move(parents);
    ++height_;
  }

  nodes_.push_back(level.front());
  root_ = static_cast<int32_t>(nodes_.size() - 1);

  spdlog::debug("[RTree] Bulk loaded {} entries into {} nodes (height {})",
                entries_.size(), nodes_.size(), height_);
}

std::vector<std::size_t> RTree::search(const BoundingBox& box) const {
  std::vector<std::size_t> hits;
  if (root_ < 0) return hits;

  std::vector<uint32_t> stack{static_cast<uint32_t>(root_)};
  while (!stack.empty()) {
    const Node& node = nodes_[stack.back()];
    stack.pop_back();
    if (!node.box.intersects(box)) continue;

    if (node.leaf) {
      for (uint32_t i = node.first; i < node.first + node.count; ++i) {
        if (entries_[i].box.intersects(box)) {
          hits.push_back(entries_[i].zone_index);
        }
      }
    } else {
      for (uint32_t i = node.first; i < node.first + node.count; ++i) {
        stack.push_back(i);
      }
    }
  }
  return hits;
}

void RTree::checkCutoff(double cutoff) const {
  geo::validateCutoff(cutoff);
}

void RTree::checkZones(const ZoneList& zones) const {
  geo::validateZoneCount(zone_count_, zones.size());
}

MatchResult RTree::correlate(const Point& point, const ZoneList& zones,
                             double cutoff) const {
  checkCutoff(cutoff);
  checkZones(zones);
  geo::validateQueryPoint(point);

  const Eigen::Vector2d p = point.toVector();
  NearestMatch best(cutoff);
  for (double step : kSearchSteps) {
    const double radius = cutoff * step;
    const Eigen::Vector2d extent = geo::degreeExtent(p, radius);
    BoundingBox query;
    query.min = p - extent;
    query.max = p + extent;

    for (size_t zone_index : search(query)) {
      const auto& zone = zones[zone_index];
      best.offer(zone_index,
                 geo::pointToSegmentDistance(p, zone.start().toVector(),
                                             zone.end().toVector()));
    }
    // Anything closer than radius intersects this box and was checked
    if (best.found() && best.bound() <= radius) break;
  }
  return best.result();
}

}  // namespace zonematch
