// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_config.cpp
 *
 * Tests for YAML configuration loading and validation.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <fstream>

#include "zonematch/config/zonematch.hpp"

using namespace zonematch;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Write a temporary YAML file and return its path.
std::string writeTempYaml(const std::string& content,
                          const std::string& name = "zonematch_test_config.yaml") {
  std::string path = "/tmp/" + name;
  std::ofstream fs(path);
  fs << content;
  return path;
}

Config parseYaml(const std::string& content) {
  return parseConfig(YAML::Load(content));
}

}  // namespace

// ─── Loading Tests ───────────────────────────────────────────────────────────

TEST(ConfigLoadTest, LoadDefaultYaml) {
  // The shipped default.yaml matches the built-in defaults
  auto cfg = loadConfig(ZONEMATCH_CONFIG_DIR "/default.yaml");

  Config defaults;
  EXPECT_EQ(cfg.correlation.algorithm, AlgorithmType::RTree);
  EXPECT_DOUBLE_EQ(cfg.correlation.cutoff, defaults.correlation.cutoff);
  EXPECT_EQ(cfg.correlation.num_threads, defaults.correlation.num_threads);
  EXPECT_DOUBLE_EQ(cfg.algorithms.grid.cell_size, defaults.algorithms.grid.cell_size);
  EXPECT_EQ(cfg.algorithms.grid.neighbor_radius,
            defaults.algorithms.grid.neighbor_radius);
  EXPECT_DOUBLE_EQ(cfg.algorithms.chunks.chunk_size,
                   defaults.algorithms.chunks.chunk_size);
  EXPECT_DOUBLE_EQ(cfg.algorithms.chunks.overlap_margin,
                   defaults.algorithms.chunks.overlap_margin);
  EXPECT_EQ(cfg.algorithms.kdtree.k, defaults.algorithms.kdtree.k);
  EXPECT_EQ(cfg.algorithms.kdtree.leaf_size, defaults.algorithms.kdtree.leaf_size);
  EXPECT_EQ(cfg.algorithms.rtree.max_entries, defaults.algorithms.rtree.max_entries);
  EXPECT_EQ(cfg.benchmark.sample_size, defaults.benchmark.sample_size);
  EXPECT_EQ(cfg.benchmark.algorithms, defaults.benchmark.algorithms);
}

TEST(ConfigLoadTest, NonexistentFileThrows) {
  EXPECT_THROW(loadConfig("/nonexistent/path.yaml"), std::runtime_error);
}

TEST(ConfigLoadTest, MalformedYamlThrows) {
  auto path = writeTempYaml("correlation: [cutoff: 50\n", "zonematch_bad.yaml");
  EXPECT_THROW(loadConfig(path), std::runtime_error);
}

TEST(ConfigLoadTest, WrongValueTypeThrows) {
  auto path = writeTempYaml("correlation:\n  cutoff: fifty\n",
                            "zonematch_bad_type.yaml");
  EXPECT_THROW(loadConfig(path), std::runtime_error);
}

TEST(ConfigLoadTest, EmptyYamlUsesDefaults) {
  auto path = writeTempYaml("# empty config\n", "zonematch_empty.yaml");
  auto cfg = loadConfig(path);

  Config defaults;
  EXPECT_EQ(cfg.correlation.algorithm, defaults.correlation.algorithm);
  EXPECT_DOUBLE_EQ(cfg.correlation.cutoff, defaults.correlation.cutoff);
  EXPECT_EQ(cfg.benchmark.algorithms.size(), kAllAlgorithms.size());
}

TEST(ConfigLoadTest, PartialYamlPreservesDefaults) {
  auto path = writeTempYaml(
      "correlation:\n"
      "  algorithm: kdtree\n"
      "kdtree:\n"
      "  k: 16\n",
      "zonematch_partial.yaml");
  auto cfg = loadConfig(path);

  EXPECT_EQ(cfg.correlation.algorithm, AlgorithmType::KDTree);
  EXPECT_EQ(cfg.algorithms.kdtree.k, 16);

  Config defaults;
  EXPECT_DOUBLE_EQ(cfg.correlation.cutoff, defaults.correlation.cutoff);
  EXPECT_EQ(cfg.algorithms.kdtree.leaf_size, defaults.algorithms.kdtree.leaf_size);
  EXPECT_EQ(cfg.algorithms.rtree.max_entries, defaults.algorithms.rtree.max_entries);
}

// ─── Algorithm Names ─────────────────────────────────────────────────────────

TEST(ConfigAlgorithmTest, CanonicalNamesRoundTrip) {
  for (AlgorithmType type : kAllAlgorithms) {
    EXPECT_EQ(parseAlgorithmType(algorithmName(type)), type);
  }
}

TEST(ConfigAlgorithmTest, Aliases) {
  EXPECT_EQ(parseAlgorithmType("distance_based"), AlgorithmType::BruteForce);
  EXPECT_EQ(parseAlgorithmType("grid_nearest"), AlgorithmType::Grid);
  EXPECT_EQ(parseAlgorithmType("chunks"), AlgorithmType::OverlappingChunks);
  EXPECT_EQ(parseAlgorithmType("kd_tree"), AlgorithmType::KDTree);
  EXPECT_EQ(parseAlgorithmType("r_tree"), AlgorithmType::RTree);
}

TEST(ConfigAlgorithmTest, UnknownNameFallsBackToRTree) {
  EXPECT_EQ(parseAlgorithmType("quadtree"), AlgorithmType::RTree);
  auto cfg = parseYaml("correlation:\n  algorithm: quadtree\n");
  EXPECT_EQ(cfg.correlation.algorithm, AlgorithmType::RTree);
}

// ─── Fatal Validation ────────────────────────────────────────────────────────

TEST(ConfigValidationTest, NonPositiveCutoffThrows) {
  EXPECT_THROW(parseYaml("correlation:\n  cutoff: 0\n"), std::invalid_argument);
  EXPECT_THROW(parseYaml("correlation:\n  cutoff: -10\n"), std::invalid_argument);
  EXPECT_THROW(parseYaml("correlation:\n  cutoff: .nan\n"), std::invalid_argument);
  EXPECT_THROW(parseYaml("correlation:\n  cutoff: .inf\n"), std::invalid_argument);
}

TEST(ConfigValidationTest, NonPositiveCellSizeThrows) {
  EXPECT_THROW(parseYaml("grid:\n  cell_size: 0\n"), std::invalid_argument);
  EXPECT_THROW(parseYaml("chunks:\n  chunk_size: -0.001\n"),
               std::invalid_argument);
}

TEST(ConfigValidationTest, FatalErrorsPropagateFromFile) {
  auto path = writeTempYaml("correlation:\n  cutoff: -1\n",
                            "zonematch_bad_cutoff.yaml");
  EXPECT_THROW(loadConfig(path), std::invalid_argument);
}

// ─── Clamping ────────────────────────────────────────────────────────────────

TEST(ConfigValidationTest, IntegerParametersClamped) {
  auto cfg = parseYaml(
      "correlation:\n"
      "  num_threads: -4\n"
      "grid:\n"
      "  neighbor_radius: 0\n"
      "kdtree:\n"
      "  k: 0\n"
      "  leaf_size: -1\n"
      "rtree:\n"
      "  max_entries: 2\n"
      "benchmark:\n"
      "  sample_size: 0\n");

  EXPECT_EQ(cfg.correlation.num_threads, 0);
  EXPECT_EQ(cfg.algorithms.grid.neighbor_radius, 1);
  EXPECT_EQ(cfg.algorithms.kdtree.k, 1);
  EXPECT_EQ(cfg.algorithms.kdtree.leaf_size, 1);
  EXPECT_EQ(cfg.algorithms.rtree.max_entries, 4);
  EXPECT_EQ(cfg.benchmark.sample_size, 1);
}

TEST(ConfigValidationTest, OverlapMarginRaisedToCutoff) {
  auto cfg = parseYaml(
      "correlation:\n"
      "  cutoff: 80\n"
      "chunks:\n"
      "  overlap_margin: 30\n");
  EXPECT_DOUBLE_EQ(cfg.algorithms.chunks.overlap_margin, 80.0);

  auto wide = parseYaml("chunks:\n  overlap_margin: 120\n");
  EXPECT_DOUBLE_EQ(wide.algorithms.chunks.overlap_margin, 120.0);
}

TEST(ConfigValidationTest, ValidValuesUntouched) {
  auto cfg = parseYaml(
      "correlation:\n"
      "  num_threads: 6\n"
      "grid:\n"
      "  neighbor_radius: 3\n"
      "rtree:\n"
      "  max_entries: 32\n");
  EXPECT_EQ(cfg.correlation.num_threads, 6);
  EXPECT_EQ(cfg.algorithms.grid.neighbor_radius, 3);
  EXPECT_EQ(cfg.algorithms.rtree.max_entries, 32);
}

// ─── Benchmark Section ───────────────────────────────────────────────────────

TEST(ConfigBenchmarkTest, AlgorithmListParsedAndDeduplicated) {
  auto cfg = parseYaml(
      "benchmark:\n"
      "  sample_size: 250\n"
      "  algorithms: [grid, kd_tree, grid_nearest, rtree]\n");

  EXPECT_EQ(cfg.benchmark.sample_size, 250);
  const std::vector<AlgorithmType> expected = {
      AlgorithmType::Grid, AlgorithmType::KDTree, AlgorithmType::RTree};
  EXPECT_EQ(cfg.benchmark.algorithms, expected);
}

TEST(ConfigBenchmarkTest, EmptyAlgorithmListMeansAll) {
  auto cfg = parseYaml("benchmark:\n  algorithms: []\n");
  EXPECT_EQ(cfg.benchmark.algorithms.size(), kAllAlgorithms.size());
}
