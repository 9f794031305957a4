/**
 * @file Statistics.cpp
 * @brief Implementation of descriptive statistics.
 */

#include "src/telemetry/inc/Statistics.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Stats Methods ----------------------------- */

std::string Stats::toString() const {
  if (count == 0) {
    return "n=0";
  }
  std::string cv = cvDefined ? fmt::format("{:.1f}%", cvPercent) : std::string("n/a");
  return fmt::format("n={} mean={:.2f} p50={:.2f} p99={:.2f} min={:.2f} max={:.2f} sd={:.2f} cv={}",
                     count, mean, p50, p99, min, max, stddev, cv);
}

/* ----------------------------- API ----------------------------- */

double percentileSorted(std::span<const double> sorted, double p) noexcept {
  const std::size_t N = sorted.size();
  if (N == 0) {
    return 0.0;
  }
  const double INDEX = (static_cast<double>(N) - 1.0) * p;
  const std::size_t LOWER = static_cast<std::size_t>(INDEX);
  const std::size_t UPPER = LOWER + 1;
  const double FRAC = INDEX - static_cast<double>(LOWER);

  if (UPPER >= N) {
    return sorted[N - 1];
  }
  return sorted[LOWER] * (1.0 - FRAC) + sorted[UPPER] * FRAC;
}

Stats computeStats(std::span<const double> values) {
  Stats stats;

  std::vector<double> sorted;
  sorted.reserve(values.size());
  for (double v : values) {
    if (std::isfinite(v)) {
      sorted.push_back(v);
    }
  }

  const std::size_t N = sorted.size();
  if (N == 0) {
    return stats;
  }

  std::sort(sorted.begin(), sorted.end());
  stats.count = N;
  stats.min = sorted.front();
  stats.max = sorted.back();

  stats.p50 = percentileSorted(sorted, 0.50);
  stats.p75 = percentileSorted(sorted, 0.75);
  stats.p90 = percentileSorted(sorted, 0.90);
  stats.p95 = percentileSorted(sorted, 0.95);
  stats.p99 = percentileSorted(sorted, 0.99);
  stats.median = stats.p50;

  // Identical values: exact mean, exact zero spread
  if (stats.min == stats.max) {
    stats.mean = stats.min;
    stats.stddev = 0.0;
  } else {
    double sum = 0.0;
    for (double v : sorted) {
      sum += v;
    }
    stats.mean = sum / static_cast<double>(N);

    double sumSq = 0.0;
    for (double v : sorted) {
      const double DIFF = v - stats.mean;
      sumSq += DIFF * DIFF;
    }
    stats.stddev = (N > 1) ? std::sqrt(sumSq / static_cast<double>(N - 1)) : 0.0;
  }

  if (stats.mean != 0.0) {
    stats.cvPercent = stats.stddev / stats.mean * 100.0;
    stats.cvDefined = true;
  }

  return stats;
}

} // namespace telemetry

} // namespace poolscope
