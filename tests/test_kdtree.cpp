// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_kdtree.cpp
 *
 * Tests for the midpoint k-d tree: index contents, k-nearest search and
 * the documented midpoint approximation.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <random>
#include <utility>

#include "common/test_data.hpp"
#include "zonematch/algorithms/brute_force.hpp"
#include "zonematch/algorithms/kdtree.hpp"

using namespace zonematch;
using namespace zonematch::test;

class KDTreeTest : public ::testing::Test {
 protected:
  static constexpr double kCutoff = 50.0;
};

// ─── Build ───────────────────────────────────────────────────────────────────

TEST_F(KDTreeTest, EmptyBuild) {
  KDTree tree;
  tree.build({});
  EXPECT_EQ(tree.size(), 0u);
  EXPECT_TRUE(tree.nearestMidpoints(Eigen::Vector2d::Zero(), 8, 1e9).empty());
  EXPECT_FALSE(tree.correlate(offset(0, 0), {}, kCutoff).has_value());
}

TEST_F(KDTreeTest, IndexesOneMidpointPerZone) {
  config::KDTree cfg;
  cfg.leaf_size = 8;
  KDTree tree(cfg);
  tree.build({segment(0, 0, 10, 0), segment(0, 20, 10, 20)});
  EXPECT_EQ(tree.size(), 2u);
  EXPECT_EQ(tree.zoneCount(), 2u);
  EXPECT_NEAR(tree.maxHalfLength(), 5.0, 0.01);
}

TEST_F(KDTreeTest, SkipsInvalidZones) {
  ZoneList zones = {segment(0, 0, 10, 0), segment(0, 20, 10, 20)};
  zones.emplace_back(corruptedPoint(), offset(5, 5));
  KDTree tree;
  tree.build(zones);
  EXPECT_EQ(tree.size(), 2u);
  EXPECT_EQ(tree.zoneCount(), 3u);

  const auto result = tree.correlate(offset(5, 18), zones, kCutoff);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->zone_index, 1u);
}

TEST_F(KDTreeTest, RebuildReplacesIndex) {
  std::mt19937 rng(1);
  KDTree tree;
  tree.build(randomSegments(rng, 1000, 2000.0, 30.0));
  EXPECT_EQ(tree.size(), 1000u);

  const ZoneList zones = {segment(0, 0, 10, 0)};
  tree.build(zones);
  EXPECT_EQ(tree.size(), 1u);
  EXPECT_TRUE(tree.correlate(offset(5, 3), zones, kCutoff).has_value());
}

TEST_F(KDTreeTest, MovedTreeStillAnswers) {
  const ZoneList zones = {segment(0, 0, 10, 0), segment(0, 30, 10, 30)};
  KDTree source;
  source.build(zones);
  const KDTree tree = std::move(source);

  const auto result = tree.correlate(offset(5, 25), zones, kCutoff);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->zone_index, 1u);
}

// ─── k-Nearest ───────────────────────────────────────────────────────────────

TEST_F(KDTreeTest, NearestMidpointsMatchesLinearScan) {
  std::mt19937 rng(2);
  const auto zones = randomSegments(rng, 500, 1000.0, 20.0);
  config::KDTree cfg;
  cfg.leaf_size = 4;
  KDTree tree(cfg);
  tree.build(zones);

  const auto& proj = tree.projection();
  const Eigen::Vector2d query = proj.project(offset(480, 510).toVector());

  std::vector<std::pair<double, size_t>> expected;
  for (size_t i = 0; i < zones.size(); ++i) {
    const Eigen::Vector2d mid =
        0.5 * (proj.project(zones[i].start().toVector()) +
               proj.project(zones[i].end().toVector()));
    expected.emplace_back((mid - query).squaredNorm(), i);
  }
  std::sort(expected.begin(), expected.end());

  const auto found = tree.nearestMidpoints(query, 10, 1e9);
  ASSERT_EQ(found.size(), 10u);
  for (size_t i = 0; i < found.size(); ++i) {
    EXPECT_EQ(found[i].second, expected[i].second);
    EXPECT_NEAR(found[i].first, expected[i].first, 1e-6);
  }
}

TEST_F(KDTreeTest, NearestMidpointsHonorsRadius) {
  KDTree tree;
  tree.build({segment(0, 0, 2, 0), segment(100, 0, 102, 0)});
  const auto query = tree.projection().project(offset(0, 0).toVector());

  EXPECT_EQ(tree.nearestMidpoints(query, 8, 10.0).size(), 1u);
  EXPECT_EQ(tree.nearestMidpoints(query, 8, 200.0).size(), 2u);
  EXPECT_TRUE(tree.nearestMidpoints(query, 0, 200.0).empty());
}

// ─── Query ───────────────────────────────────────────────────────────────────

TEST_F(KDTreeTest, ClosestOfSeveral) {
  const ZoneList zones = {segment(0, 40, 100, 40), segment(0, 10, 100, 10),
                          segment(0, -20, 100, -20)};
  KDTree tree;
  tree.build(zones);

  const auto result = tree.correlate(offset(50, 0), zones, kCutoff);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->zone_index, 1u);
  EXPECT_NEAR(result->distance, 10.0, 0.05);
}

TEST_F(KDTreeTest, LongSegmentReachedThroughHalfLength) {
  // Midpoint 400 m away, segment end 20 m away
  const ZoneList zones = {segment(20, 0, 820, 0)};
  KDTree tree;
  tree.build(zones);

  const auto result = tree.correlate(offset(0, 0), zones, kCutoff);
  ASSERT_TRUE(result.has_value());
  EXPECT_NEAR(result->distance, 20.0, 0.05);
}

TEST_F(KDTreeTest, SmallKCanMissTrueNearest) {
  // Many short zones cluster around the query; a long zone passes closer but
  // its midpoint is far away.
  ZoneList zones;
  for (int i = 0; i < 10; ++i) {
    zones.push_back(segment(-30 + i, 30, -29 + i, 30));
  }
  zones.push_back(segment(-20, 5, 780, 5));

  config::KDTree cfg;
  cfg.k = 2;
  KDTree tree(cfg);
  tree.build(zones);

  const auto approx = tree.correlate(offset(0, 0), zones, kCutoff);
  const auto exact = BruteForce().correlate(offset(0, 0), zones, kCutoff);
  ASSERT_TRUE(approx.has_value());
  ASSERT_TRUE(exact.has_value());
  EXPECT_EQ(exact->zone_index, 10u);
  EXPECT_NE(approx->zone_index, exact->zone_index);
  EXPECT_GT(approx->distance, exact->distance);
}

TEST_F(KDTreeTest, Errors) {
  const ZoneList zones = {segment(0, 0, 10, 0)};
  KDTree tree;
  tree.build(zones);
  EXPECT_THROW(tree.correlate(offset(0, 0), zones, std::nan("")),
               std::invalid_argument);
  EXPECT_THROW(tree.correlate(offset(0, 0), {}, kCutoff), std::invalid_argument);
  EXPECT_THROW(tree.correlate(corruptedPoint(), zones, kCutoff),
               std::domain_error);
}
