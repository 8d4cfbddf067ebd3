// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * algorithms.hpp
 *
 * Correlation algorithm selection and per-algorithm index parameters.
 */

#ifndef ZONEMATCH_CONFIG_ALGORITHMS_HPP
#define ZONEMATCH_CONFIG_ALGORITHMS_HPP

#include <array>

namespace zonematch {

/// Nearest-zone search strategy.
enum class AlgorithmType {
  BruteForce,         ///< Linear scan (reference result)
  Raycasting,         ///< Ring containment, then nearest edge
  Grid,               ///< Fixed-size cell index
  OverlappingChunks,  ///< Coarse chunks with overlap margin
  KDTree,             ///< k nearest segment midpoints
  RTree               ///< Bulk-loaded bounding-box tree
};

inline constexpr std::array<AlgorithmType, 6> kAllAlgorithms = {
    AlgorithmType::BruteForce, AlgorithmType::Raycasting,
    AlgorithmType::Grid,       AlgorithmType::OverlappingChunks,
    AlgorithmType::KDTree,     AlgorithmType::RTree};

inline const char* algorithmName(AlgorithmType type) {
  switch (type) {
    case AlgorithmType::BruteForce:
      return "brute_force";
    case AlgorithmType::Raycasting:
      return "raycasting";
    case AlgorithmType::Grid:
      return "grid";
    case AlgorithmType::OverlappingChunks:
      return "overlapping_chunks";
    case AlgorithmType::KDTree:
      return "kdtree";
    case AlgorithmType::RTree:
      return "rtree";
  }
  return "unknown";
}

namespace config {

/**
 * @brief Fixed grid index parameters.
 *
 * Results are exact when cutoff <= cell_size * neighbor_radius (in meters).
 * A larger cutoff can miss zones outside the searched block.
 */
struct Grid {
  double cell_size = 0.0005;  ///< Cell edge [deg], roughly 55 m of latitude
  int neighbor_radius = 1;    ///< 1 = 3x3 block around the query cell
};

/// Overlapping chunk parameters.
struct Chunks {
  double chunk_size = 0.001;     ///< Chunk edge [deg]
  double overlap_margin = 50.0;  ///< Zone box growth [m], must be >= cutoff
};

/**
 * @brief k-d tree parameters.
 *
 * The tree indexes segment midpoints only; a long segment whose midpoint is
 * outside the k nearest can be missed.
 */
struct KDTree {
  int k = 8;          ///< Midpoint candidates checked per query
  int leaf_size = 8;  ///< Max points per leaf bucket
};

struct RTree {
  int max_entries = 16;  ///< Node fan-out
};

/// Index parameters for every algorithm. Each algorithm reads its own part.
struct Algorithms {
  Grid grid;
  Chunks chunks;
  KDTree kdtree;
  RTree rtree;
};

}  // namespace config
}  // namespace zonematch

#endif  // ZONEMATCH_CONFIG_ALGORITHMS_HPP
