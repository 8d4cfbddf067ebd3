// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>
//
// Benchmark: correlation algorithms on a synthetic city
//
// Lays out a street grid of parking zones (straight curb segments plus a
// few closed blocks) and scatters addresses over the same area, then times
// every configured algorithm.
//
// Usage:
//   benchmark_algorithms [config.yaml] [num_addresses]

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "zonematch/zonematch.hpp"

using namespace zonematch;

// ============================================================================
// Synthetic City
// ============================================================================

namespace {

constexpr double kOriginLon = 12.97;
constexpr double kOriginLat = 55.58;
constexpr double kBlockDeg = 0.0012;  // ~75 m north-south
constexpr int kBlocks = 40;

ZoneList generateZones(std::mt19937& rng) {
  std::uniform_real_distribution<double> jitter(-0.00002, 0.00002);
  std::uniform_int_distribution<int> day(1, 31);

  ZoneList zones;
  for (int i = 0; i < kBlocks; ++i) {
    for (int j = 0; j < kBlocks; ++j) {
      const double lon = kOriginLon + i * kBlockDeg;
      const double lat = kOriginLat + j * kBlockDeg;
      RestrictionInfo info{"Street cleaning", "0800-1200", day(rng), "Taxa 3"};

      // Every 7th block is a closed square, the rest get one curb segment
      if ((i * kBlocks + j) % 7 == 0) {
        const double s = kBlockDeg * 0.4;
        const Point p0(lon, lat), p1(lon + s, lat), p2(lon + s, lat + s),
            p3(lon, lat + s);
        zones.emplace_back(p0, p1, info);
        zones.emplace_back(p1, p2, info);
        zones.emplace_back(p2, p3, info);
        zones.emplace_back(p3, p0, info);
      } else {
        const Point a(lon + jitter(rng), lat + jitter(rng));
        const Point b(lon + kBlockDeg * 0.5 + jitter(rng), lat + jitter(rng));
        zones.emplace_back(a, b, info);
      }
    }
  }
  return zones;
}

AddressList generateAddresses(std::mt19937& rng, size_t count) {
  std::uniform_real_distribution<double> lon(kOriginLon,
                                             kOriginLon + kBlocks * kBlockDeg);
  std::uniform_real_distribution<double> lat(kOriginLat,
                                             kOriginLat + kBlocks * kBlockDeg);
  AddressList addresses;
  addresses.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    AddressRecord a;
    a.point = Point(lon(rng), lat(rng));
    a.street = "Gata " + std::to_string(i % 97);
    a.number = std::to_string(1 + i % 60);
    a.postal_code = "21" + std::to_string(100 + i % 900);
    addresses.push_back(std::move(a));
  }
  return addresses;
}

void printReport(const BenchmarkReport& report, double cutoff) {
  char buf[256];
  std::string table = "\n";

  snprintf(buf, sizeof(buf),
           "[ZoneMatch Benchmark] %zu addresses, cutoff %.1f m%s\n",
           report.sample_size, cutoff, report.clamped() ? " (clamped)" : "");
  table += buf;
  snprintf(buf, sizeof(buf), "%-4s %-20s %10s %10s %12s %8s %6s\n", "Rank",
           "Algorithm", "Build(ms)", "Query(ms)", "Avg(us/q)", "Matches",
           "Fail");
  table += buf;
  table += std::string(76, '-') + "\n";

  for (const auto& s : report.samples) {
    snprintf(buf, sizeof(buf), "%-4zu %-20s %10.2f %10.2f %12.2f %8zu %6zu\n",
             s.rank, s.algorithm.c_str(), s.build_ms, s.total_query_ms,
             s.avg_query_us, s.matches_found, s.failures);
    table += buf;
  }
  spdlog::info(table);

  if (const auto* best = report.fastest()) {
    spdlog::info("Fastest: {} ({:.2f} ms total)", best->algorithm,
                 best->totalMs());
  }
}

}  // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
  Config cfg;
  if (argc > 1) {
    try {
      cfg = loadConfig(argv[1]);
    } catch (const std::exception& e) {
      spdlog::error("{}", e.what());
      return 1;
    }
  }
  const size_t num_addresses =
      argc > 2 ? std::strtoul(argv[2], nullptr, 10) : 20000;

  std::mt19937 rng(42);
  const ZoneList zones = generateZones(rng);
  const AddressList addresses = generateAddresses(rng, num_addresses);
  spdlog::info("Synthetic city: {} zones, {} addresses", zones.size(),
               addresses.size());

  const Benchmarker benchmarker(cfg);
  const auto report = benchmarker.run(addresses, zones);
  printReport(report, cfg.correlation.cutoff);
  return 0;
}
