// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_zonematch.cpp
 *
 * YAML configuration loading.
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "zonematch/config/zonematch.hpp"

namespace zonematch {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Config parse(const YAML::Node& root) {
  Config cfg;

  if (auto n = root["correlation"]) {
    std::string algorithm_str;
    load(n, "algorithm", algorithm_str);
    if (!algorithm_str.empty())
      cfg.correlation.algorithm = parseAlgorithmType(algorithm_str);
    load(n, "cutoff", cfg.correlation.cutoff);
    load(n, "num_threads", cfg.correlation.num_threads);
  }

  auto& a = cfg.algorithms;
  if (auto n = root["grid"]) {
    load(n, "cell_size", a.grid.cell_size);
    load(n, "neighbor_radius", a.grid.neighbor_radius);
  }
  if (auto n = root["chunks"]) {
    load(n, "chunk_size", a.chunks.chunk_size);
    load(n, "overlap_margin", a.chunks.overlap_margin);
  }
  if (auto n = root["kdtree"]) {
    load(n, "k", a.kdtree.k);
    load(n, "leaf_size", a.kdtree.leaf_size);
  }
  if (auto n = root["rtree"]) {
    load(n, "max_entries", a.rtree.max_entries);
  }

  if (auto n = root["benchmark"]) {
    load(n, "sample_size", cfg.benchmark.sample_size);
    if (auto list = n["algorithms"]) {
      std::vector<AlgorithmType> algorithms;
      for (const auto& item : list) {
        const auto type = parseAlgorithmType(item.as<std::string>());
        if (std::find(algorithms.begin(), algorithms.end(), type) ==
            algorithms.end()) {
          algorithms.push_back(type);
        }
      }
      cfg.benchmark.algorithms = std::move(algorithms);
    }
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: values no index can be built or queried with ---
  const double cutoff = cfg.correlation.cutoff;
  if (!std::isfinite(cutoff) || cutoff <= 0.0) {
    throw std::invalid_argument("correlation.cutoff must be > 0, got " +
                                std::to_string(cutoff));
  }
  if (!(cfg.algorithms.grid.cell_size > 0.0)) {
    throw std::invalid_argument("grid.cell_size must be > 0, got " +
                                std::to_string(cfg.algorithms.grid.cell_size));
  }
  if (!(cfg.algorithms.chunks.chunk_size > 0.0)) {
    throw std::invalid_argument(
        "chunks.chunk_size must be > 0, got " +
        std::to_string(cfg.algorithms.chunks.chunk_size));
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp = [](const std::string& name, auto& val, auto lo, auto hi) {
    if (val < lo || val > hi) {
      spdlog::warn("[Config] {} ({}) out of range [{}, {}], clamping", name, val,
                   lo, hi);
      val = std::clamp(val, static_cast<decltype(val)>(lo),
                       static_cast<decltype(val)>(hi));
    }
  };
  constexpr int kIntMax = std::numeric_limits<int>::max();

  warn_clamp("correlation.num_threads", cfg.correlation.num_threads, 0, kIntMax);
  warn_clamp("grid.neighbor_radius", cfg.algorithms.grid.neighbor_radius, 1,
             kIntMax);
  warn_clamp("kdtree.k", cfg.algorithms.kdtree.k, 1, kIntMax);
  warn_clamp("kdtree.leaf_size", cfg.algorithms.kdtree.leaf_size, 1, kIntMax);
  warn_clamp("rtree.max_entries", cfg.algorithms.rtree.max_entries, 4, kIntMax);
  warn_clamp("benchmark.sample_size", cfg.benchmark.sample_size, 1, kIntMax);

  // Zones farther than the margin are invisible to a chunk
  auto& margin = cfg.algorithms.chunks.overlap_margin;
  if (!(margin >= cutoff)) {
    spdlog::warn(
        "[Config] chunks.overlap_margin ({}) must be >= correlation.cutoff, "
        "clamping to {}",
        margin, cutoff);
    margin = cutoff;
  }

  if (cfg.benchmark.algorithms.empty()) {
    spdlog::warn("[Config] benchmark.algorithms is empty, using all algorithms");
    cfg.benchmark.algorithms.assign(kAllAlgorithms.begin(),
                                    kAllAlgorithms.end());
  }
}

}  // namespace detail

AlgorithmType parseAlgorithmType(const std::string& name) {
  if (name == "brute_force" || name == "distance_based")
    return AlgorithmType::BruteForce;
  if (name == "raycasting") return AlgorithmType::Raycasting;
  if (name == "grid" || name == "grid_nearest") return AlgorithmType::Grid;
  if (name == "overlapping_chunks" || name == "chunks")
    return AlgorithmType::OverlappingChunks;
  if (name == "kdtree" || name == "kd_tree") return AlgorithmType::KDTree;
  if (name == "rtree" || name == "r_tree") return AlgorithmType::RTree;
  spdlog::warn("[Config] Unknown algorithm '{}', defaulting to rtree", name);
  return AlgorithmType::RTree;
}

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace zonematch
