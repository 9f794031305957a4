/**
 * @file AnomalyDetector.cpp
 * @brief Implementation of z-score anomaly detection.
 */

#include "src/telemetry/inc/AnomalyDetector.hpp"

#include "src/telemetry/inc/Metrics.hpp"
#include "src/telemetry/inc/Statistics.hpp"

#include <cmath>
#include <utility>

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

template <typename SampleT>
void detectMetric(std::span<const SampleT> samples, const MetricDef<SampleT>& metric,
                  const AnomalyConfig& config, std::vector<AnomalyRecord>& out) {
  std::vector<MetricPoint> series;
  series.reserve(samples.size());
  for (const SampleT& s : samples) {
    series.push_back(MetricPoint{s.timestampNs, metric.get(s)});
  }
  std::vector<AnomalyRecord> found = detectAnomalies(series, metric.name, config);
  for (AnomalyRecord& r : found) {
    out.push_back(std::move(r));
  }
}

} // namespace

/* ----------------------------- toString ----------------------------- */

const char* toString(AnomalyDirection direction) noexcept {
  switch (direction) {
  case AnomalyDirection::SPIKE:
    return "spike";
  case AnomalyDirection::DROP:
    return "drop";
  }
  return "unknown";
}

std::string AnomalyRecord::toString() const {
  return fmt::format("{} {} {:.2f} (z={:.2f})", metric, telemetry::toString(direction), value,
                     zScore);
}

/* ----------------------------- API ----------------------------- */

std::vector<AnomalyRecord> detectAnomalies(std::span<const MetricPoint> series,
                                           std::string_view metric, const AnomalyConfig& config) {
  std::vector<AnomalyRecord> out;
  if (series.size() < 2) {
    return out;
  }

  std::vector<double> values;
  values.reserve(series.size());
  for (const MetricPoint& p : series) {
    values.push_back(p.value);
  }
  const Stats STATS = computeStats(values);
  if (STATS.stddev == 0.0) {
    return out;
  }

  for (const MetricPoint& p : series) {
    if (!std::isfinite(p.value)) {
      continue;
    }
    const double Z = (p.value - STATS.mean) / STATS.stddev;
    if (std::fabs(Z) > config.zThreshold) {
      AnomalyRecord rec;
      rec.timestampNs = p.timestampNs;
      rec.metric = std::string(metric);
      rec.value = p.value;
      rec.zScore = Z;
      rec.direction = (Z > 0.0) ? AnomalyDirection::SPIKE : AnomalyDirection::DROP;
      out.push_back(std::move(rec));
    }
  }
  return out;
}

std::vector<AnomalyRecord> detectPoolAnomalies(std::span<const PoolSample> samples,
                                               const AnomalyConfig& config) {
  std::vector<AnomalyRecord> out;
  for (const MetricDef<PoolSample>& metric : POOL_METRICS) {
    detectMetric(samples, metric, config, out);
  }
  return out;
}

std::vector<AnomalyRecord> detectArcAnomalies(std::span<const ArcSample> samples, bool hasL2arc,
                                              const AnomalyConfig& config) {
  std::vector<AnomalyRecord> out;
  for (const MetricDef<ArcSample>& metric : ARC_METRICS) {
    if (metric.l2arcOnly && !hasL2arc) {
      continue;
    }
    detectMetric(samples, metric, config, out);
  }
  return out;
}

} // namespace telemetry

} // namespace poolscope
