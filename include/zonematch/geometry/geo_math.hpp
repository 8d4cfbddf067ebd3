// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geo_math.hpp
 *
 * Distance and grid-cell primitives shared by all correlation algorithms.
 *
 * Coordinates are (longitude, latitude) in degrees. Distances are meters on
 * a spherical earth. The haversine error is about 0.5% below 100 m, which is
 * acceptable at the cutoff scale used for address matching; no ellipsoidal
 * (Vincenty) correction is applied.
 */

#ifndef ZONEMATCH_GEOMETRY_GEO_MATH_HPP
#define ZONEMATCH_GEOMETRY_GEO_MATH_HPP

#include <Eigen/Core>
#include <array>
#include <cstddef>
#include <vector>

#include "zonematch/geometry/cell_hash.hpp"
#include "zonematch/types.hpp"

namespace zonematch::geo {

constexpr double kEarthRadius = 6371000.0;  ///< Meters
constexpr double kDegToRad = 0.017453292519943295;
/// Meridian arc length of one degree on the sphere.
constexpr double kMetersPerDegree = kEarthRadius * kDegToRad;

/// Great-circle distance between two (lon, lat) positions [m].
double haversineDistance(const Eigen::Vector2d& p1, const Eigen::Vector2d& p2);
double haversineDistance(const Point& p1, const Point& p2);

/**
 * @brief Distance from p to segment (a, b) [m].
 *
 * Projects p onto the line through (a, b) in coordinate space, clamps the
 * projection parameter to [0, 1] and returns the haversine distance to the
 * clamped point. A zero-length segment returns haversineDistance(p, a).
 */
double pointToSegmentDistance(const Eigen::Vector2d& p,
                              const Eigen::Vector2d& a,
                              const Eigen::Vector2d& b);
double pointToSegmentDistance(const Point& p, const Point& a, const Point& b);

/// floor(v / cell_size) saturated to +-2^30 so neighbor offsets stay in range.
int cellIndex(double v, double cell_size);

/// Floor-division cell index of a position.
Cell gridCell(const Eigen::Vector2d& p, double cell_size);
Cell gridCell(const Point& p, double cell_size);

/// The cell itself and its 8 immediate neighbors.
std::array<Cell, 9> neighborCells(const Cell& cell);

/// The (2 * radius + 1)^2 block centred on cell.
std::vector<Cell> neighborCells(const Cell& cell, int radius);

/**
 * @brief All cells crossed by segment (a, b).
 *
 * Incremental grid traversal (Amanatides & Woo) from a's cell to b's cell.
 * Cells are deduplicated on insertion.
 */
CellSet segmentCells(const Eigen::Vector2d& a, const Eigen::Vector2d& b,
                     double cell_size);
CellSet segmentCells(const Point& a, const Point& b, double cell_size);

/**
 * @brief Half-size (d_lon, d_lat) of a degree box around p that contains
 * every position within `meters` haversine distance of p.
 *
 * Longitude extent is computed at the latitude farthest from the equator
 * that the box can reach, so the box is conservative.
 */
Eigen::Vector2d degreeExtent(const Eigen::Vector2d& p, double meters);

/**
 * @brief Equirectangular projection to local meters around a reference
 * latitude.
 *
 * Distortion stays below 0.1% within a few kilometres of the reference,
 * enough to rank nearby candidates for the point-based indexes.
 */
class LocalProjection {
 public:
  LocalProjection() = default;
  explicit LocalProjection(double reference_latitude);

  Eigen::Vector2d project(const Eigen::Vector2d& lonlat) const noexcept {
    return Eigen::Vector2d(lonlat.x() * meters_per_lon_, lonlat.y() * kMetersPerDegree);
  }

  double metersPerLongitude() const noexcept { return meters_per_lon_; }

 private:
  double meters_per_lon_ = kMetersPerDegree;
};

/// @throws std::invalid_argument unless cutoff is finite and positive
void validateCutoff(double cutoff);

/// @throws std::domain_error when the query point carries a non-finite
/// coordinate
void validateQueryPoint(const Point& point);

/// @throws std::invalid_argument when a query passes a zone list of a
/// different size than the one the index was built from
void validateZoneCount(std::size_t indexed, std::size_t given);

}  // namespace zonematch::geo

#endif  // ZONEMATCH_GEOMETRY_GEO_MATH_HPP
