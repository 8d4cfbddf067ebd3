// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_types.cpp
 *
 * Tests for fixed-point coordinates and zone records.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "zonematch/types.hpp"

using namespace zonematch;

// ─── Decimal ─────────────────────────────────────────────────────────────────

TEST(DecimalTest, ParseIsExact) {
  EXPECT_EQ(Decimal::parse("55.6").raw(), 55600000000LL);
  EXPECT_EQ(Decimal::parse("-13.000000001").raw(), -13000000001LL);
  EXPECT_EQ(Decimal::parse("0").raw(), 0);
  EXPECT_EQ(Decimal::parse(".5").raw(), 500000000);
  EXPECT_EQ(Decimal::parse("+7.").raw(), 7000000000LL);
}

TEST(DecimalTest, ParseRoundsTenthDigit) {
  EXPECT_EQ(Decimal::parse("1.0000000004").raw(), 1000000000);
  EXPECT_EQ(Decimal::parse("1.0000000005").raw(), 1000000001);
  EXPECT_EQ(Decimal::parse("-1.0000000009").raw(), -1000000001);
}

TEST(DecimalTest, ParseRejectsMalformed) {
  EXPECT_THROW(Decimal::parse(""), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("-"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("1.2.3"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("12a"), std::invalid_argument);
  EXPECT_THROW(Decimal::parse("99999999999"), std::invalid_argument);
}

TEST(DecimalTest, FromDoubleRoundsToNearest) {
  EXPECT_EQ(Decimal(55.6), Decimal::parse("55.6"));
  EXPECT_EQ(Decimal(0.1234567891).raw(), 123456789);
  EXPECT_NEAR(Decimal(13.0004).toDouble(), 13.0004, 1e-12);
}

TEST(DecimalTest, NonFiniteIsInvalid) {
  const Decimal nan(std::numeric_limits<double>::quiet_NaN());
  const Decimal inf(std::numeric_limits<double>::infinity());
  const Decimal huge(1e12);

  EXPECT_FALSE(nan.isValid());
  EXPECT_FALSE(inf.isValid());
  EXPECT_FALSE(huge.isValid());
  EXPECT_TRUE(std::isnan(nan.toDouble()));
  EXPECT_EQ(nan.toString(), "NaN");
}

TEST(DecimalTest, ToStringTrimsZeros) {
  EXPECT_EQ(Decimal::parse("55.600").toString(), "55.6");
  EXPECT_EQ(Decimal::parse("-0.000000001").toString(), "-0.000000001");
  EXPECT_EQ(Decimal::parse("13").toString(), "13");
  EXPECT_EQ(Decimal::parse("-2.5").toString(), "-2.5");
}

TEST(DecimalTest, Ordering) {
  EXPECT_LT(Decimal::parse("1.1"), Decimal::parse("1.2"));
  EXPECT_GT(Decimal::parse("-1.1"), Decimal::parse("-1.2"));
  EXPECT_LE(Decimal::parse("3"), Decimal::parse("3.0"));
}

// ─── Point / ZoneSegment ─────────────────────────────────────────────────────

TEST(PointTest, EqualityIsExact) {
  const Point a(Decimal::parse("13.0"), Decimal::parse("55.6"));
  const Point b(13.0, 55.6);
  const Point c(13.000000001, 55.6);

  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_DOUBLE_EQ(a.toVector().x(), 13.0);
  EXPECT_DOUBLE_EQ(a.toVector().y(), 55.6);
}

TEST(PointTest, InvalidCoordinate) {
  const Point p(Decimal(std::nan("")), Decimal(55.6));
  EXPECT_FALSE(p.isValid());
  EXPECT_TRUE(Point(13.0, 55.6).isValid());
}

TEST(ZoneSegmentTest, DegenerateAndRestriction) {
  const Point p(13.0, 55.6);
  ZoneSegment point_zone(p, p, RestrictionInfo{"Städning", "0800-1200", 4, "Taxa 1"});
  ZoneSegment line_zone(p, Point(13.001, 55.6));

  EXPECT_TRUE(point_zone.isDegenerate());
  EXPECT_FALSE(line_zone.isDegenerate());
  EXPECT_EQ(point_zone.restriction().day, 4);
  EXPECT_EQ(point_zone.restriction().time_window, "0800-1200");
  EXPECT_TRUE(line_zone.restriction().info.empty());
}
