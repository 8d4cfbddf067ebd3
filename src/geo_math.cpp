// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * geo_math.cpp
 *
 * Spherical distances and grid traversal.
 */

#include "zonematch/geometry/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace zonematch::geo {

namespace {

// Widening applied to degree boxes. Covers the gap between a parallel arc
// and the great circle at the distances used for matching.
constexpr double kExtentSlack = 1.01;
// Keeps cos(latitude) away from zero near the poles.
constexpr double kMaxBoxLatitude = 89.9;

double sinSquaredHalf(double angle) {
  const double s = std::sin(angle * 0.5);
  return s * s;
}

}  // namespace

double haversineDistance(const Eigen::Vector2d& p1, const Eigen::Vector2d& p2) {
  const double lat1 = p1.y() * kDegToRad;
  const double lat2 = p2.y() * kDegToRad;
  const double dlat = lat2 - lat1;
  const double dlon = (p2.x() - p1.x()) * kDegToRad;

  double a = sinSquaredHalf(dlat) +
             std::cos(lat1) * std::cos(lat2) * sinSquaredHalf(dlon);
  a = std::clamp(a, 0.0, 1.0);
  const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return kEarthRadius * c;
}

double haversineDistance(const Point& p1, const Point& p2) {
  return haversineDistance(p1.toVector(), p2.toVector());
}

double pointToSegmentDistance(const Eigen::Vector2d& p,
                              const Eigen::Vector2d& a,
                              const Eigen::Vector2d& b) {
  const Eigen::Vector2d ab = b - a;
  const double length_sq = ab.squaredNorm();
  if (length_sq == 0.0) {
    return haversineDistance(p, a);
  }

  const double t = std::clamp((p - a).dot(ab) / length_sq, 0.0, 1.0);
  const Eigen::Vector2d closest = a + t * ab;
  return haversineDistance(p, closest);
}

double pointToSegmentDistance(const Point& p, const Point& a, const Point& b) {
  if (a == b) {
    return haversineDistance(p, a);
  }
  return pointToSegmentDistance(p.toVector(), a.toVector(), b.toVector());
}

int cellIndex(double v, double cell_size) {
  constexpr double kLimit = static_cast<double>(1 << 30);
  // fmax maps NaN to the lower limit
  const double index =
      std::fmin(std::fmax(std::floor(v / cell_size), -kLimit), kLimit);
  return static_cast<int>(index);
}

Cell gridCell(const Eigen::Vector2d& p, double cell_size) {
  return Cell(cellIndex(p.x(), cell_size), cellIndex(p.y(), cell_size));
}

Cell gridCell(const Point& p, double cell_size) {
  return gridCell(p.toVector(), cell_size);
}

std::array<Cell, 9> neighborCells(const Cell& cell) {
  std::array<Cell, 9> cells;
  size_t n = 0;
  for (int dx = -1; dx <= 1; ++dx) {
    for (int dy = -1; dy <= 1; ++dy) {
      cells[n++] = Cell(cell(0) + dx, cell(1) + dy);
    }
  }
  return cells;
}

std::vector<Cell> neighborCells(const Cell& cell, int radius) {
  radius = std::max(radius, 0);
  const int side = 2 * radius + 1;
  std::vector<Cell> cells;
  cells.reserve(static_cast<size_t>(side) * side);
  for (int dx = -radius; dx <= radius; ++dx) {
    for (int dy = -radius; dy <= radius; ++dy) {
      cells.emplace_back(cell(0) + dx, cell(1) + dy);
    }
  }
  return cells;
}

CellSet segmentCells(const Eigen::Vector2d& a, const Eigen::Vector2d& b,
                     double cell_size) {
  const Cell start = gridCell(a, cell_size);
  const Cell target = gridCell(b, cell_size);

  CellSet cells;
  Cell current = start;
  cells.insert(current);

  const Eigen::Vector2d dir = b - a;
  const int step_x = (target(0) > start(0)) - (target(0) < start(0));
  const int step_y = (target(1) > start(1)) - (target(1) < start(1));

  // Parametric distance (t in [0, 1]) to the next vertical / horizontal
  // cell border, and the t advance per crossed cell.
  constexpr double kInf = std::numeric_limits<double>::infinity();
  double t_max_x = kInf;
  double t_delta_x = kInf;
  if (step_x != 0 && dir.x() != 0.0) {
    const double border = (step_x > 0 ? start(0) + 1 : start(0)) * cell_size;
    t_max_x = (border - a.x()) / dir.x();
    t_delta_x = cell_size / std::abs(dir.x());
  }
  double t_max_y = kInf;
  double t_delta_y = kInf;
  if (step_y != 0 && dir.y() != 0.0) {
    const double border = (step_y > 0 ? start(1) + 1 : start(1)) * cell_size;
    t_max_y = (border - a.y()) / dir.y();
    t_delta_y = cell_size / std::abs(dir.y());
  }

  // Every step moves one axis toward the target cell, so the walk ends after
  // exactly |dx| + |dy| steps regardless of floating-point drift.
  const int steps = std::abs(target(0) - start(0)) + std::abs(target(1) - start(1));
  for (int i = 0; i < steps; ++i) {
    const bool x_remaining = current(0) != target(0);
    const bool y_remaining = current(1) != target(1);
    if (x_remaining && (!y_remaining || t_max_x < t_max_y)) {
      current(0) += step_x;
      t_max_x += t_delta_x;
    } else {
      current(1) += step_y;
      t_max_y += t_delta_y;
    }
    cells.insert(current);
  }
  return cells;
}

CellSet segmentCells(const Point& a, const Point& b, double cell_size) {
  return segmentCells(a.toVector(), b.toVector(), cell_size);
}

Eigen::Vector2d degreeExtent(const Eigen::Vector2d& p, double meters) {
  const double d_lat = meters / kMetersPerDegree;
  const double far_lat = std::min(std::abs(p.y()) + d_lat, kMaxBoxLatitude);
  const double d_lon =
      std::min(meters / (kMetersPerDegree * std::cos(far_lat * kDegToRad)), 360.0);
  return Eigen::Vector2d(d_lon * kExtentSlack, d_lat * kExtentSlack);
}

LocalProjection::LocalProjection(double reference_latitude)
    : meters_per_lon_(kMetersPerDegree *
                      std::cos(std::clamp(reference_latitude, -kMaxBoxLatitude,
                                          kMaxBoxLatitude) *
                               kDegToRad)) {}

void validateCutoff(double cutoff) {
  if (!std::isfinite(cutoff) || cutoff <= 0.0) {
    throw std::invalid_argument("cutoff must be finite and > 0, got " +
                                std::to_string(cutoff));
  }
}

void validateQueryPoint(const Point& point) {
  if (!point.isValid()) {
    throw std::domain_error("query point has a non-finite coordinate");
  }
}

void validateZoneCount(std::size_t indexed, std::size_t given) {
  if (indexed != given) {
    throw std::invalid_argument("index was built from " +
                                std::to_string(indexed) + " zones, got " +
                                std::to_string(given));
  }
}

}  // namespace zonematch::geo
