// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * zonematch.hpp
 *
 * ZoneMatch: nearest restriction zone for address points.
 *
 * Typical use:
 *   auto cfg = zonematch::loadConfig("config/default.yaml");
 *   auto algorithm = zonematch::CorrelationAlgorithm::create(
 *       cfg.correlation.algorithm, cfg.algorithms);
 *   algorithm.build(zones);
 *   auto batch = zonematch::CorrelationRunner(cfg.correlation)
 *                    .run(addresses, zones, algorithm);
 */

#ifndef ZONEMATCH_ZONEMATCH_HPP
#define ZONEMATCH_ZONEMATCH_HPP

// Configs
#include "zonematch/config/zonematch.hpp"

// Data types
#include "zonematch/types.hpp"

// Core objects
#include "zonematch/algorithms/correlation_algorithm.hpp"
#include "zonematch/benchmarker.hpp"
#include "zonematch/correlation_runner.hpp"
#include "zonematch/geometry/geo_math.hpp"

#endif  // ZONEMATCH_ZONEMATCH_HPP
