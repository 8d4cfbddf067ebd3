// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_data.hpp
 *
 * Geometry helpers for tests: points and zones placed by meter offsets
 * around a reference position in Malmö.
 */

#ifndef ZONEMATCH_TESTS_COMMON_TEST_DATA_HPP
#define ZONEMATCH_TESTS_COMMON_TEST_DATA_HPP

#include <cmath>
#include <random>
#include <string>

#include "zonematch/geometry/geo_math.hpp"
#include "zonematch/types.hpp"

namespace zonematch::test {

// Reference sits inside grid cells and chunks, not on their borders
constexpr double kLon0 = 13.0002;
constexpr double kLat0 = 55.6002;

inline double metersPerDegLat() { return geo::kMetersPerDegree; }
inline double metersPerDegLon() {
  return geo::kMetersPerDegree * std::cos(kLat0 * geo::kDegToRad);
}

/// Position east_m / north_m meters from the reference.
inline Point offset(double east_m, double north_m) {
  return Point(kLon0 + east_m / metersPerDegLon(),
               kLat0 + north_m / metersPerDegLat());
}

inline ZoneSegment segment(double e1, double n1, double e2, double n2) {
  return ZoneSegment(offset(e1, n1), offset(e2, n2));
}

inline AddressRecord address(double east_m, double north_m,
                             const std::string& street = "Testgatan") {
  AddressRecord a;
  a.point = offset(east_m, north_m);
  a.street = street;
  a.number = "1";
  a.postal_code = "21100";
  return a;
}

/// Point with a non-finite longitude (corrupted upstream record).
inline Point corruptedPoint() {
  return Point(Decimal(std::nan("")), Decimal(kLat0));
}

/// Random segments up to max_length_m long, start inside [0, extent_m]^2.
inline ZoneList randomSegments(std::mt19937& rng, size_t count, double extent_m,
                               double max_length_m) {
  std::uniform_real_distribution<double> pos(0.0, extent_m);
  std::uniform_real_distribution<double> len(0.0, max_length_m);
  std::uniform_real_distribution<double> angle(0.0, 360.0);
  ZoneList zones;
  zones.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const double e = pos(rng), n = pos(rng);
    const double l = len(rng), a = angle(rng);
    zones.push_back(segment(e, n, e + l * std::cos(a * geo::kDegToRad),
                                n + l * std::sin(a * geo::kDegToRad)));
  }
  return zones;
}

inline AddressList randomAddresses(std::mt19937& rng, size_t count,
                                   double extent_m) {
  std::uniform_real_distribution<double> pos(0.0, extent_m);
  AddressList addresses;
  addresses.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    addresses.push_back(address(pos(rng), pos(rng),
                                "Gata " + std::to_string(i)));
  }
  return addresses;
}

}  // namespace zonematch::test

#endif  // ZONEMATCH_TESTS_COMMON_TEST_DATA_HPP
