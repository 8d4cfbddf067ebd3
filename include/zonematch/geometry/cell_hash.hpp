// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cell_hash.hpp
 *
 * Grid cell key type and hash utilities for unordered containers.
 */

#ifndef ZONEMATCH_GEOMETRY_CELL_HASH_HPP
#define ZONEMATCH_GEOMETRY_CELL_HASH_HPP

#include <Eigen/Core>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <unordered_set>

namespace zonematch {

/// Integer grid cell (column along x, row along y). Unbounded, may be negative.
using Cell = Eigen::Array2i;

struct CellHash {
  std::size_t operator()(const Cell& cell) const {
    const auto key =
        (static_cast<uint64_t>(static_cast<uint32_t>(cell(0))) << 32) |
        static_cast<uint64_t>(static_cast<uint32_t>(cell(1)));
    return std::hash<uint64_t>()(key);
  }
};

struct CellEqual {
  bool operator()(const Cell& a, const Cell& b) const {
    return a(0) == b(0) && a(1) == b(1);
  }
};

template <typename T>
using CellMap = std::unordered_map<Cell, T, CellHash, CellEqual>;

using CellSet = std::unordered_set<Cell, CellHash, CellEqual>;

}  // namespace zonematch

#endif  // ZONEMATCH_GEOMETRY_CELL_HASH_HPP
