/**
 * @file LatencyScaler.cpp
 * @brief Implementation of latency unit selection.
 */

#include "src/telemetry/inc/LatencyScaler.hpp"

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

const char* toString(LatencyUnit unit) noexcept {
  switch (unit) {
  case LatencyUnit::MILLISECONDS:
    return "ms";
  case LatencyUnit::MICROSECONDS:
    return "us";
  }
  return "?";
}

std::string ScaledStats::toString() const {
  const char* u = telemetry::toString(unit);
  return fmt::format("mean={:.2f}{} p50={:.2f}{} p99={:.2f}{} max={:.2f}{}", stats.mean, u,
                     stats.p50, u, stats.p99, u, stats.max, u);
}

ScaledStats scaleLatency(const Stats& msStats) noexcept {
  ScaledStats out;
  out.stats = msStats;
  if (msStats.count == 0 || msStats.mean >= 1.0) {
    return out;
  }

  constexpr double FACTOR = 1000.0;
  out.unit = LatencyUnit::MICROSECONDS;
  Stats& s = out.stats;
  s.mean *= FACTOR;
  s.median *= FACTOR;
  s.min *= FACTOR;
  s.max *= FACTOR;
  s.stddev *= FACTOR;
  s.p50 *= FACTOR;
  s.p75 *= FACTOR;
  s.p90 *= FACTOR;
  s.p95 *= FACTOR;
  s.p99 *= FACTOR;
  return out;
}

} // namespace telemetry

} // namespace poolscope
