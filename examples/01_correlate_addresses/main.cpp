// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 01_correlate_addresses - batch correlation with a loaded config
 *
 * Demonstrates:
 * - Loading the default YAML config
 * - Building the configured algorithm over a handful of zones
 * - Running an address batch and reading match results
 */

#include <zonematch/zonematch.hpp>

#include <iostream>

using namespace zonematch;

int main() {
  std::cout << "=== 01_correlate_addresses ===\n" << std::endl;

  // 1. Load config
  auto cfg = loadConfig(EXAMPLE_CONFIG_DIR "/default.yaml");
  std::cout << "Algorithm: " << algorithmName(cfg.correlation.algorithm)
            << ", cutoff " << cfg.correlation.cutoff << " m\n"
            << std::endl;

  // 2. Zones along two streets in Malmö
  ZoneList zones;
  zones.emplace_back(Point(Decimal::parse("13.000000"), Decimal::parse("55.600000")),
                     Point(Decimal::parse("13.001000"), Decimal::parse("55.600000")),
                     RestrictionInfo{"Street cleaning", "0800-1200", 3, "Taxa 2"});
  zones.emplace_back(Point(Decimal::parse("13.002000"), Decimal::parse("55.601000")),
                     Point(Decimal::parse("13.002000"), Decimal::parse("55.602000")),
                     RestrictionInfo{"Street cleaning", "1200-1600", 17, "Taxa 3"});

  AddressList addresses = {
      {Point(13.0005, 55.6001), "Storgatan", "4", "21142"},
      {Point(13.0021, 55.6015), "Kungsgatan", "12", "21149"},
      {Point(13.0100, 55.6100), "Parkvägen", "1", "21220"},
  };

  // 3. Build and run
  auto algorithm =
      CorrelationAlgorithm::create(cfg.correlation.algorithm, cfg.algorithms);
  algorithm.build(zones);
  auto batch = CorrelationRunner(cfg.correlation).run(addresses, zones, algorithm);

  // 4. Report
  for (size_t i = 0; i < addresses.size(); ++i) {
    const auto& a = addresses[i];
    std::cout << a.street << " " << a.number << ": ";
    if (const auto& m = batch.results[i]) {
      const auto& info = zones[m->zone_index].restriction();
      std::cout << info.info << " " << info.time_window << " day " << info.day
                << " (" << m->distance << " m)" << std::endl;
    } else {
      std::cout << "no zone within cutoff" << std::endl;
    }
  }
  std::cout << "\nMatched " << batch.matched() << " of " << addresses.size()
            << std::endl;
  return 0;
}
