// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * types.hpp
 *
 * Input records and match results shared by every correlation algorithm.
 */

#ifndef ZONEMATCH_TYPES_HPP
#define ZONEMATCH_TYPES_HPP

#include <Eigen/Core>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace zonematch {

/**
 * @brief Fixed-point decimal with 9 fractional digits.
 *
 * Coordinates are stored as integer multiples of 1e-9 so that equality
 * between vertices is exact and repeated conversions never accumulate
 * rounding error. 1e-9 degree is roughly 0.1 mm on the ground.
 *
 * A value built from a non-finite or out-of-range double is invalid;
 * toDouble() then returns NaN.
 */
class Decimal {
 public:
  static constexpr int kFractionDigits = 9;
  static constexpr int64_t kScale = 1000000000;

  constexpr Decimal() noexcept = default;

  /// Round to the nearest representable value (half away from zero).
  explicit Decimal(double value) noexcept;

  /// Parse "[-]digits[.digits]". Digits past the 9th are rounded.
  /// @throws std::invalid_argument on malformed or out-of-range text
  static Decimal parse(const std::string& text);

  static constexpr Decimal fromRaw(int64_t raw) noexcept {
    Decimal d;
    d.raw_ = raw;
    return d;
  }

  constexpr int64_t raw() const noexcept { return raw_; }
  constexpr bool isValid() const noexcept { return raw_ != kInvalidRaw; }

  double toDouble() const noexcept;
  std::string toString() const;

  friend constexpr bool operator==(Decimal a, Decimal b) noexcept {
    return a.raw_ == b.raw_;
  }
  friend constexpr bool operator!=(Decimal a, Decimal b) noexcept {
    return a.raw_ != b.raw_;
  }
  friend constexpr bool operator<(Decimal a, Decimal b) noexcept {
    return a.raw_ < b.raw_;
  }
  friend constexpr bool operator>(Decimal a, Decimal b) noexcept {
    return b < a;
  }
  friend constexpr bool operator<=(Decimal a, Decimal b) noexcept {
    return !(b < a);
  }
  friend constexpr bool operator>=(Decimal a, Decimal b) noexcept {
    return !(a < b);
  }

 private:
  static constexpr int64_t kInvalidRaw = std::numeric_limits<int64_t>::min();

  int64_t raw_ = 0;
};

/// Immutable 2D coordinate: (longitude, latitude) in degrees for WGS84,
/// (easting, northing) for projected systems.
class Point {
 public:
  Point() = default;
  Point(Decimal x, Decimal y) noexcept : x_(x), y_(y) {}
  Point(double x, double y) noexcept : x_(x), y_(y) {}

  Decimal x() const noexcept { return x_; }
  Decimal y() const noexcept { return y_; }

  /// Working-precision copy for distance math.
  Eigen::Vector2d toVector() const noexcept {
    return Eigen::Vector2d(x_.toDouble(), y_.toDouble());
  }

  bool isValid() const noexcept { return x_.isValid() && y_.isValid(); }

  friend bool operator==(const Point& a, const Point& b) noexcept {
    return a.x_ == b.x_ && a.y_ == b.y_;
  }
  friend bool operator!=(const Point& a, const Point& b) noexcept {
    return !(a == b);
  }

 private:
  Decimal x_;
  Decimal y_;
};

/// Restriction attached to a zone. Carried for the caller, never read by
/// the correlation core.
struct RestrictionInfo {
  std::string info;
  std::string time_window;  ///< e.g. "0800-1200"
  int day = 0;              ///< Day of month the restriction applies
  std::string tariff;
};

/// One edge of a restriction zone boundary. start == end is allowed and
/// represents a point-like zone.
class ZoneSegment {
 public:
  ZoneSegment(const Point& start, const Point& end,
              RestrictionInfo restriction = {})
      : start_(start), end_(end), restriction_(std::move(restriction)) {}

  const Point& start() const noexcept { return start_; }
  const Point& end() const noexcept { return end_; }
  const RestrictionInfo& restriction() const noexcept { return restriction_; }

  bool isDegenerate() const noexcept { return start_ == end_; }
  bool isValid() const noexcept { return start_.isValid() && end_.isValid(); }

 private:
  Point start_;
  Point end_;
  RestrictionInfo restriction_;
};

/// Address to correlate. One query per record.
struct AddressRecord {
  Point point;
  std::string street;
  std::string number;
  std::string postal_code;
};

/// Nearest zone found for one query.
struct Match {
  std::size_t zone_index = 0;
  double distance = 0.0;  ///< Meters, 0 <= distance <= cutoff
};

using MatchResult = std::optional<Match>;

using ZoneList = std::vector<ZoneSegment>;
using AddressList = std::vector<AddressRecord>;

}  // namespace zonematch

#endif  // ZONEMATCH_TYPES_HPP
