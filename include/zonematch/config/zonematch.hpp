// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef ZONEMATCH_CONFIG_ZONEMATCH_HPP
#define ZONEMATCH_CONFIG_ZONEMATCH_HPP

#include <string>
#include <vector>

namespace YAML {
class Node;
}

#include "zonematch/config/algorithms.hpp"

namespace zonematch {

namespace config {

/// Batch correlation settings.
struct Correlation {
  AlgorithmType algorithm = AlgorithmType::RTree;
  double cutoff = 50.0;  ///< Max match distance [m]
  int num_threads = 0;   ///< 0 = all available cores
};

struct Benchmark {
  int sample_size = 1000;  ///< Addresses per algorithm run
  std::vector<AlgorithmType> algorithms{kAllAlgorithms.begin(),
                                        kAllAlgorithms.end()};
};

}  // namespace config

/// Top-level configuration for ZoneMatch.
struct Config {
  config::Correlation correlation;
  config::Algorithms algorithms;
  config::Benchmark benchmark;
};

/// @throws std::invalid_argument on fatal values (non-positive cutoff,
/// cell_size or chunk_size)
Config parseConfig(const YAML::Node& root);

/// @throws std::runtime_error if the file is missing or not valid YAML
Config loadConfig(const std::string& path);

/// Parse an algorithm name. Unknown names log a warning and return RTree.
AlgorithmType parseAlgorithmType(const std::string& name);

}  // namespace zonematch

#endif  // ZONEMATCH_CONFIG_ZONEMATCH_HPP
