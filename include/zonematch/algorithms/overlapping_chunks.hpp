// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * overlapping_chunks.hpp
 *
 * Coarse spatial chunks whose zone lists overlap by a metric margin.
 */

#ifndef ZONEMATCH_ALGORITHMS_OVERLAPPING_CHUNKS_HPP
#define ZONEMATCH_ALGORITHMS_OVERLAPPING_CHUNKS_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "zonematch/config/algorithms.hpp"
#include "zonematch/geometry/cell_hash.hpp"
#include "zonematch/progress_counter.hpp"
#include "zonematch/types.hpp"

namespace zonematch {

class NearestMatch;

/**
 * @brief Chunked brute-force search.
 *
 * Each chunk of chunk_size degrees lists every zone whose bounding box,
 * grown by overlap_margin meters, touches the chunk. Any zone within the
 * margin of a point is therefore listed in the point's chunk, and a query
 * only scans that chunk. A point on a chunk border is searched in both
 * chunks.
 *
 * Cutoffs larger than the margin are rejected.
 */
class OverlappingChunks {
 public:
  /// @throws std::invalid_argument if chunk_size is not finite and positive
  explicit OverlappingChunks(const config::Chunks& cfg = {});

  void build(const ZoneList& zones);

  /// @throws std::invalid_argument if cutoff is not finite and positive or
  /// exceeds the overlap margin
  void checkCutoff(double cutoff) const;

  /// @throws std::invalid_argument if zones differ in size from the index
  void checkZones(const ZoneList& zones) const;

  MatchResult correlate(const Point& point, const ZoneList& zones,
                        double cutoff) const;

  /**
   * @brief Correlate a batch, one parallel task per chunk.
   *
   * Points are grouped by chunk so each chunk's zone list is scanned by a
   * single worker. Results keep input order.
   *
   * @param num_threads 0 = all available cores
   * @param failed Optional per-point flags, set to 1 for points with a
   *        non-finite coordinate (their result is nullopt)
   * @param progress Optional counter, advanced once per point as it finishes
   */
  std::vector<MatchResult> correlateAll(const std::vector<Point>& points,
                                        const ZoneList& zones, double cutoff,
                                        int num_threads = 0,
                                        std::vector<uint8_t>* failed = nullptr,
                                        ProgressCounter* progress = nullptr) const;

  /// Chunks the point belongs to (more than one on a chunk border).
  std::vector<Cell> chunksOf(const Point& point) const;

  const std::vector<std::size_t>& chunkZones(const Cell& chunk) const;

  std::size_t chunkCount() const { return chunks_.size(); }
  std::size_t zoneCount() const { return zone_count_; }
  const config::Chunks& config() const { return cfg_; }

 private:
  void searchChunk(const Cell& chunk, const Eigen::Vector2d& p,
                   const ZoneList& zones, NearestMatch& best) const;

  config::Chunks cfg_;
  CellMap<std::vector<std::size_t>> chunks_;
  std::size_t zone_count_ = 0;
};

}  // namespace zonematch

#endif  // ZONEMATCH_ALGORITHMS_OVERLAPPING_CHUNKS_HPP
