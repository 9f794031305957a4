/**
 * @file Analytics.cpp
 * @brief Implementation of segment statistics and run summaries.
 */

#include "src/telemetry/inc/Analytics.hpp"

#include "src/helpers/inc/Format.hpp"
#include "src/telemetry/inc/LatencyScaler.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

using helpers::format::number;

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

template <typename SampleT, std::size_t N>
std::vector<MetricStats> metricStats(std::span<const SampleT> samples,
                                     const std::array<MetricDef<SampleT>, N>& table,
                                     bool hasL2arc) {
  std::vector<MetricStats> out;
  out.reserve(N);
  for (const MetricDef<SampleT>& metric : table) {
    if (metric.l2arcOnly && !hasL2arc) {
      continue;
    }
    const std::vector<double> VALUES = extractMetric(samples, metric);
    out.push_back(MetricStats{std::string(metric.name), metric.family, computeStats(VALUES)});
  }
  return out;
}

template <typename SampleT>
Phase dominantPhase(std::span<const SampleT> samples) noexcept {
  std::array<std::size_t, PHASE_COUNT> counts{};
  for (const SampleT& s : samples) {
    ++counts[static_cast<std::size_t>(s.phase)];
  }
  std::size_t best = 0;
  for (std::size_t i = 1; i < PHASE_COUNT; ++i) {
    if (counts[i] > counts[best]) {
      best = i;
    }
  }
  return static_cast<Phase>(best);
}

/// Steady-state labels in order of first appearance.
template <typename SampleT>
std::vector<std::string> segmentLabels(std::span<const SampleT> samples) {
  std::vector<std::string> labels;
  for (const SampleT& s : samples) {
    if (!isSteadyStateLabel(s.segmentLabel)) {
      continue;
    }
    bool seen = false;
    for (const std::string& l : labels) {
      if (l == s.segmentLabel) {
        seen = true;
        break;
      }
    }
    if (!seen) {
      labels.push_back(s.segmentLabel);
    }
  }
  return labels;
}

template <typename SampleT, std::size_t N>
std::vector<SegmentStats> segmentStats(std::span<const SampleT> samples,
                                       const std::array<MetricDef<SampleT>, N>& table,
                                       bool hasL2arc) {
  std::vector<SegmentStats> out;
  for (const std::string& label : segmentLabels(samples)) {
    std::vector<SampleT> members;
    for (const SampleT& s : samples) {
      if (s.segmentLabel == label) {
        members.push_back(s);
      }
    }
    const std::span<const SampleT> VIEW(members);

    SegmentStats seg;
    seg.segmentLabel = label;
    seg.sampleCount = members.size();
    seg.phase = dominantPhase(VIEW);
    seg.metrics = metricStats(VIEW, table, hasL2arc);
    out.push_back(std::move(seg));
  }
  return out;
}

template <typename SampleT>
std::vector<SampleT> filterSteady(std::span<const SampleT> samples, bool readOnly) {
  std::vector<SampleT> out;
  for (const SampleT& s : samples) {
    if (!isSteadyStateLabel(s.segmentLabel)) {
      continue;
    }
    if (readOnly && s.phase != Phase::READ) {
      continue;
    }
    out.push_back(s);
  }
  return out;
}

/// One table row. Latency blocks pick their own unit.
std::string metricRow(const MetricStats& m) {
  if (m.stats.empty()) {
    return fmt::format("  {:<22} {:>10}\n", m.metric, "-");
  }
  if (m.family == MetricFamily::LATENCY) {
    const ScaledStats S = scaleLatency(m.stats);
    const char* u = toString(S.unit);
    return fmt::format("  {:<22} {:>10} {:>10} {:>10} {:>10} {:>8} {}\n", m.metric,
                       number(S.stats.mean), number(S.stats.p50), number(S.stats.p99),
                       number(S.stats.stddev), number(S.stats.cvPercent), u);
  }
  return fmt::format("  {:<22} {:>10} {:>10} {:>10} {:>10} {:>8}\n", m.metric,
                     number(m.stats.mean), number(m.stats.p50), number(m.stats.p99),
                     number(m.stats.stddev), number(m.stats.cvPercent));
}

std::string metricTable(const std::vector<MetricStats>& metrics) {
  std::string out = fmt::format("  {:<22} {:>10} {:>10} {:>10} {:>10} {:>8}\n", "metric", "mean",
                                "p50", "p99", "stddev", "cv%");
  for (const MetricStats& m : metrics) {
    out += metricRow(m);
  }
  return out;
}

} // namespace

/* ----------------------------- SegmentStats Methods ----------------------------- */

const MetricStats* SegmentStats::find(std::string_view metric) const noexcept {
  for (const MetricStats& m : metrics) {
    if (m.metric == metric) {
      return &m;
    }
  }
  return nullptr;
}

std::string SegmentStats::toString() const {
  std::string out = fmt::format("segment '{}' ({} samples, {})\n", segmentLabel, sampleCount,
                                telemetry::toString(phase));
  out += metricTable(metrics);
  return out;
}

/* ----------------------------- Summary Methods ----------------------------- */

std::string CapacityStats::toString() const {
  return fmt::format("start={:.2f} end={:.2f} min={:.2f} peak={:.2f} GiB", startGiB, endGiB,
                     minGiB, maxGiB);
}

std::string PoolSummary::toString() const {
  std::string out = fmt::format("{}: {} samples ({} steady-state) over {:.1f}s{}\n", source,
                                sampleCount, steadyStateCount, durationSec,
                                complete ? "" : " [incomplete]");
  if (parseWarningCount > 0) {
    out += fmt::format("  {} fields could not be parsed and were zeroed\n", parseWarningCount);
  }
  out += fmt::format("  phases: {}\n", phases.toString());
  if (capacity.count > 0) {
    out += fmt::format("  allocated: {}\n", capacity.toString());
  }
  out += "steady state\n";
  out += metricTable(steadyState);
  for (const SegmentStats& seg : segments) {
    out += seg.toString();
  }
  for (const IoSizeStats& io : ioSize) {
    out += fmt::format("  io size {}\n", io.toString());
  }
  if (!anomalies.empty()) {
    out += fmt::format("anomalies ({})\n", anomalies.size());
    for (const AnomalyRecord& a : anomalies) {
      out += fmt::format("  {} {}\n", helpers::format::isoTimestamp(a.timestampNs), a.toString());
    }
  }
  return out;
}

std::string ArcSummary::toString() const {
  std::string out = fmt::format("{}: {} samples ({} read-phase) over {:.1f}s{}{}\n", source,
                                sampleCount, readPhaseCount, durationSec,
                                hasL2arc ? ", L2ARC present" : "",
                                complete ? "" : " [incomplete]");
  out += "read phase\n";
  out += metricTable(readPhase);
  for (const SegmentStats& seg : readSegments) {
    out += seg.toString();
  }
  if (!anomalies.empty()) {
    out += fmt::format("anomalies ({})\n", anomalies.size());
    for (const AnomalyRecord& a : anomalies) {
      out += fmt::format("  {} {}\n", helpers::format::isoTimestamp(a.timestampNs), a.toString());
    }
  }
  return out;
}

std::string RunAnalysis::toString() const {
  std::string out = pool.toString();
  if (arc) {
    out += arc->toString();
  }
  if (!scaling.write.points.empty()) {
    out += "scaling\n";
    out += scaling.toString();
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

std::vector<SegmentStats> computeSegmentStats(std::span<const PoolSample> samples) {
  return segmentStats(samples, POOL_METRICS, false);
}

std::vector<SegmentStats> computeSegmentStats(std::span<const ArcSample> samples, bool hasL2arc) {
  return segmentStats(samples, ARC_METRICS, hasL2arc);
}

CapacityStats computeCapacity(std::span<const PoolSample> samples) noexcept {
  CapacityStats out;
  if (samples.empty()) {
    return out;
  }
  out.count = samples.size();
  out.startGiB = samples.front().allocGiB;
  out.endGiB = samples.back().allocGiB;
  out.minGiB = out.startGiB;
  out.maxGiB = out.startGiB;
  for (const PoolSample& s : samples) {
    out.minGiB = std::min(out.minGiB, s.allocGiB);
    out.maxGiB = std::max(out.maxGiB, s.allocGiB);
  }
  return out;
}

std::vector<PoolSample> steadyStateSamples(std::span<const PoolSample> samples) {
  return filterSteady(samples, false);
}

PoolSummary summarizePool(const PoolTelemetry& telemetry, const AnalyticsConfig& config) {
  const std::span<const PoolSample> ALL(telemetry.samples);
  const std::vector<PoolSample> STEADY = steadyStateSamples(ALL);

  PoolSummary out;
  out.source = telemetry.source;
  out.complete = telemetry.complete;
  out.durationSec = telemetry.durationSec();
  out.sampleCount = ALL.size();
  out.steadyStateCount = STEADY.size();
  out.parseWarningCount = telemetry.parseWarningCount;
  out.overall = metricStats(ALL, POOL_METRICS, false);
  out.steadyState = metricStats(std::span<const PoolSample>(STEADY), POOL_METRICS, false);
  out.segments = computeSegmentStats(ALL);
  out.phases = phaseBreakdown(ALL);
  out.capacity = computeCapacity(ALL);
  out.ioSize = computeIoSizeByPhase(STEADY);
  out.anomalies = detectPoolAnomalies(STEADY, config.anomaly);
  return out;
}

ArcSummary summarizeArc(const ArcTelemetry& telemetry, const AnalyticsConfig& config) {
  const std::span<const ArcSample> ALL(telemetry.samples);
  const std::vector<ArcSample> STEADY = filterSteady(ALL, false);
  const std::vector<ArcSample> READS = filterSteady(ALL, true);

  ArcSummary out;
  out.source = telemetry.source;
  out.complete = telemetry.complete;
  out.hasL2arc = !ALL.empty() && ALL.front().hasL2arc();
  out.durationSec = telemetry.durationSec();
  out.sampleCount = ALL.size();
  out.readPhaseCount = READS.size();
  out.overall = metricStats(ALL, ARC_METRICS, out.hasL2arc);
  out.readPhase = metricStats(std::span<const ArcSample>(READS), ARC_METRICS, out.hasL2arc);
  out.readSegments = computeSegmentStats(READS, out.hasL2arc);
  out.anomalies = detectArcAnomalies(STEADY, out.hasL2arc, config.anomaly);
  return out;
}

RunAnalysis analyzeRun(const PoolTelemetry& pool, const ArcTelemetry* arc,
                       std::span<const ScalingInput> scaling, const AnalyticsConfig& config) {
  RunAnalysis out;
  out.pool = summarizePool(pool, config);
  if (arc != nullptr) {
    out.arc = summarizeArc(*arc, config);
  }
  out.scaling = analyzeScaling(scaling, config.scaling);
  return out;
}

} // namespace telemetry

} // namespace poolscope
