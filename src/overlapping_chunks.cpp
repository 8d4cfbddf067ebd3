// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * overlapping_chunks.cpp
 *
 * Chunk build with metric overlap and chunk-parallel batch queries.
 */

#include "zonematch/algorithms/overlapping_chunks.hpp"

#include <omp.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>
#include <string>

#include "zonematch/geometry/geo_math.hpp"
#include "zonematch/geometry/nearest_match.hpp"

namespace zonematch {

namespace {

/// Chunk indices along one axis that contain coordinate v. Two on a border.
void axisChunks(double v, double chunk_size, int out[2], int& n) {
  const double scaled = v / chunk_size;
  out[0] = geo::cellIndex(v, chunk_size);
  n = 1;
  if (scaled == std::floor(scaled)) out[n++] = out[0] - 1;
}

}  // namespace

OverlappingChunks::OverlappingChunks(const config::Chunks& cfg) : cfg_(cfg) {
  if (!(cfg_.chunk_size > 0.0) || !std::isfinite(cfg_.chunk_size)) {
    throw std::invalid_argument("chunks.chunk_size must be finite and > 0, got " +
                                std::to_string(cfg_.chunk_size));
  }
}

void OverlappingChunks::build(const ZoneList& zones) {
  chunks_.clear();
  zone_count_ = zones.size();

  size_t skipped = 0;
  size_t entries = 0;
  for (size_t i = 0; i < zones.size(); ++i) {
    const auto& zone = zones[i];
    if (!zone.isValid()) {
      ++skipped;
      continue;
    }
    const Eigen::Vector2d a = zone.start().toVector();
    const Eigen::Vector2d b = zone.end().toVector();

    // Grow the box by the margin measured at its poleward edge, where a
    // degree of longitude is shortest
    const Eigen::Vector2d poleward(a.x(), std::abs(a.y()) > std::abs(b.y()) ? a.y() : b.y());
    const Eigen::Vector2d margin = geo::degreeExtent(poleward, cfg_.overlap_margin);
    const Eigen::Vector2d lo = a.cwiseMin(b) - margin;
    const Eigen::Vector2d hi = a.cwiseMax(b) + margin;

    const Cell first = geo::gridCell(lo, cfg_.chunk_size);
    const Cell last = geo::gridCell(hi, cfg_.chunk_size);
    for (int cx = first(0); cx <= last(0); ++cx) {
      for (int cy = first(1); cy <= last(1); ++cy) {
        chunks_[Cell(cx, cy)].push_back(i);
        ++entries;
      }
    }
  }

  if (skipped > 0) {
    spdlog::warn("[Chunks] Skipped {} zones with non-finite coordinates",
                 skipped);
  }
  spdlog::debug("[Chunks] Built {} chunks ({} entries, margin {} m)",
                chunks_.size(), entries, cfg_.overlap_margin);
}

void OverlappingChunks::checkCutoff(double cutoff) const {
  geo::validateCutoff(cutoff);
  if (cutoff > cfg_.overlap_margin) {
    throw std::invalid_argument(
        "cutoff (" + std::to_string(cutoff) +
        " m) exceeds chunk overlap margin (" +
        std::to_string(cfg_.overlap_margin) + " m)");
  }
}

void OverlappingChunks::checkZones(const ZoneList& zones) const {
  geo::validateZoneCount(zone_count_, zones.size());
}

std::vector<Cell> OverlappingChunks::chunksOf(const Point& point) const {
  const Eigen::Vector2d p = point.toVector();
  int xs[2], ys[2];
  int nx = 0, ny = 0;
  axisChunks(p.x(), cfg_.chunk_size, xs, nx);
  axisChunks(p.y(), cfg_.chunk_size, ys, ny);

  std::vector<Cell> out;
  out.reserve(nx * ny);
  for (int i = 0; i < nx; ++i) {
    for (int j = 0; j < ny; ++j) {
      out.emplace_back(xs[i], ys[j]);
    }
  }
  return out;
}

const std::vector<std::size_t>& OverlappingChunks::chunkZones(
    const Cell& chunk) const {
  static const std::vector<std::size_t> kEmpty;
  auto it = chunks_.find(chunk);
  return it == chunks_.end() ? kEmpty : it->second;
}

void OverlappingChunks::searchChunk(const Cell& chunk, const Eigen::Vector2d& p,
                                    const ZoneList& zones,
                                    NearestMatch& best) const {
  for (size_t zone_index : chunkZones(chunk)) {
    const auto& zone = zones[zone_index];
    best.offer(zone_index,
               geo::pointToSegmentDistance(p, zone.start().toVector(),
                                           zone.end().toVector()));
  }
}

MatchResult OverlappingChunks::correlate(const Point& point,
                                         const ZoneList& zones,
                                         double cutoff) const {
  checkCutoff(cutoff);
  checkZones(zones);
  geo::validateQueryPoint(point);

  const Eigen::Vector2d p = point.toVector();
  NearestMatch best(cutoff);
  for (const auto& chunk : chunksOf(point)) {
    searchChunk(chunk, p, zones, best);
  }
  return best.result();
}

std::vector<MatchResult> OverlappingChunks::correlateAll(
    const std::vector<Point>& points, const ZoneList& zones, double cutoff,
    int num_threads, std::vector<uint8_t>* failed,
    ProgressCounter* progress) const {
  checkCutoff(cutoff);
  checkZones(zones);

  std::vector<MatchResult> results(points.size());
  if (failed) failed->assign(points.size(), 0);

  // Group points by their primary chunk; border points scan the extra
  // chunks themselves
  CellMap<std::vector<size_t>> groups;
  for (size_t i = 0; i < points.size(); ++i) {
    if (!points[i].isValid()) {
      if (failed) (*failed)[i] = 1;
      if (progress) progress->add();
      spdlog::debug("[Chunks] Point {} has a non-finite coordinate", i);
      continue;
    }
    groups[geo::gridCell(points[i], cfg_.chunk_size)].push_back(i);
  }

  std::vector<const std::vector<size_t>*> tasks;
  tasks.reserve(groups.size());
  for (const auto& [chunk, members] : groups) tasks.push_back(&members);

  const int threads = num_threads > 0 ? num_threads : omp_get_max_threads();
  const int n_tasks = static_cast<int>(tasks.size());

#pragma omp parallel for num_threads(threads) schedule(dynamic, 1)
  for (int t = 0; t < n_tasks; ++t) {
    for (size_t i : *tasks[t]) {
      const Eigen::Vector2d p = points[i].toVector();
      NearestMatch best(cutoff);
      for (const auto& chunk : chunksOf(points[i])) {
        searchChunk(chunk, p, zones, best);
      }
      results[i] = best.result();
      if (progress) progress->add();
    }
  }

  spdlog::debug("[Chunks] Correlated {} points in {} chunk groups",
                points.size(), tasks.size());
  return results;
}

}  // namespace zonematch
