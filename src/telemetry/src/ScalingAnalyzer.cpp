/**
 * @file ScalingAnalyzer.cpp
 * @brief Implementation of thread-count scaling analysis.
 */

#include "src/telemetry/inc/ScalingAnalyzer.hpp"

#include <algorithm>
#include <utility>

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Internal Helpers ----------------------------- */

namespace {

DirectionScaling analyzeDirection(std::span<const ScalingInput> sorted,
                                  ScalingDirection direction) {
  DirectionScaling out;
  out.direction = direction;
  if (sorted.empty()) {
    return out;
  }

  auto speedOf = [direction](const ScalingInput& in) noexcept {
    return direction == ScalingDirection::WRITE ? in.avgWriteMBps : in.avgReadMBps;
  };

  const double BASELINE = speedOf(sorted.front());
  out.points.reserve(sorted.size());
  for (const ScalingInput& in : sorted) {
    ScalingPoint p;
    p.threads = in.threads;
    p.speedMBps = speedOf(in);
    p.vsSingleThread = (BASELINE > 0.0) ? p.speedMBps / BASELINE : 0.0;
    out.points.push_back(p);
  }

  // First maximum wins on ties
  out.peakSpeedMBps = out.points.front().speedMBps;
  out.peakThreads = out.points.front().threads;
  for (const ScalingPoint& p : out.points) {
    if (p.speedMBps > out.peakSpeedMBps) {
      out.peakSpeedMBps = p.speedMBps;
      out.peakThreads = p.threads;
    }
  }
  out.threadEfficiency =
      (out.peakThreads > 0) ? out.peakSpeedMBps / static_cast<double>(out.peakThreads) : 0.0;

  for (std::size_t i = 1; i < out.points.size(); ++i) {
    const ScalingPoint& prev = out.points[i - 1];
    const ScalingPoint& cur = out.points[i];

    ScalingDelta d;
    d.fromThreads = prev.threads;
    d.toThreads = cur.threads;
    d.deltaSpeed = cur.speedMBps - prev.speedMBps;
    if (prev.speedMBps != 0.0) {
      d.percentChange = d.deltaSpeed / prev.speedMBps * 100.0;
      d.percentDefined = true;
    }

    if (d.deltaSpeed > 0.0) {
      ++out.positiveTransitions;
    } else if (d.deltaSpeed < 0.0) {
      ++out.negativeTransitions;
    }
    out.deltas.push_back(d);
  }

  return out;
}

void observe(const DirectionScaling& dir, const ScalingConfig& config,
             std::vector<ScalingObservation>& out) {
  if (dir.points.empty()) {
    return;
  }
  const char* name = toString(dir.direction);

  ScalingObservation peak;
  peak.kind = ObservationKind::PEAK;
  peak.direction = dir.direction;
  peak.fromThreads = dir.peakThreads;
  peak.toThreads = dir.peakThreads;
  peak.description = fmt::format("{} throughput peaks at {:.1f} MB/s with {} threads", name,
                                 dir.peakSpeedMBps, dir.peakThreads);
  out.push_back(std::move(peak));

  for (std::size_t i = 0; i < dir.deltas.size(); ++i) {
    const ScalingDelta& d = dir.deltas[i];

    if (d.isNegative()) {
      ScalingObservation obs;
      obs.kind = ObservationKind::NEGATIVE_TRANSITION;
      obs.direction = dir.direction;
      obs.fromThreads = d.fromThreads;
      obs.toThreads = d.toThreads;
      obs.percentChange = d.percentChange;
      obs.description = fmt::format("{} throughput changes by {:.1f}% from {} to {} threads", name,
                                    d.percentChange, d.fromThreads, d.toThreads);
      out.push_back(std::move(obs));
      continue;
    }

    if (i == 0 || d.deltaSpeed <= 0.0 || !d.percentDefined) {
      continue;
    }
    const ScalingDelta& before = dir.deltas[i - 1];
    if (before.deltaSpeed > 0.0 && before.percentDefined &&
        before.percentChange >= config.priorGainPct &&
        d.percentChange < config.diminishingThresholdPct) {
      ScalingObservation obs;
      obs.kind = ObservationKind::DIMINISHING_RETURNS;
      obs.direction = dir.direction;
      obs.fromThreads = d.fromThreads;
      obs.toThreads = d.toThreads;
      obs.percentChange = d.percentChange;
      obs.description =
          fmt::format("{} throughput gains {:.1f}% from {} to {} threads after {:.1f}% previously",
                      name, d.percentChange, d.fromThreads, d.toThreads, before.percentChange);
      out.push_back(std::move(obs));
    }
  }
}

} // namespace

/* ----------------------------- toString ----------------------------- */

const char* toString(ScalingDirection direction) noexcept {
  switch (direction) {
  case ScalingDirection::WRITE:
    return "write";
  case ScalingDirection::READ:
    return "read";
  }
  return "unknown";
}

const char* toString(ObservationKind kind) noexcept {
  switch (kind) {
  case ObservationKind::PEAK:
    return "peak";
  case ObservationKind::NEGATIVE_TRANSITION:
    return "negative transition";
  case ObservationKind::DIMINISHING_RETURNS:
    return "diminishing returns";
  }
  return "unknown";
}

std::string DirectionScaling::toString() const {
  std::string out = fmt::format("{}: peak {:.1f} MB/s @ {} threads, {:.1f} MB/s per thread, "
                                "{} positive / {} negative transitions\n",
                                telemetry::toString(direction), peakSpeedMBps, peakThreads,
                                threadEfficiency, positiveTransitions, negativeTransitions);
  for (const ScalingPoint& p : points) {
    out += fmt::format("  {:>4} threads  {:>10.1f} MB/s  {:>6.2f}x\n", p.threads, p.speedMBps,
                       p.vsSingleThread);
  }
  for (const ScalingDelta& d : deltas) {
    if (d.percentDefined) {
      out += fmt::format("  {:>4} -> {:<4} {:>+10.1f} MB/s  {:>+7.1f}%\n", d.fromThreads,
                         d.toThreads, d.deltaSpeed, d.percentChange);
    } else {
      out += fmt::format("  {:>4} -> {:<4} {:>+10.1f} MB/s      n/a\n", d.fromThreads, d.toThreads,
                         d.deltaSpeed);
    }
  }
  return out;
}

std::string ScalingAnalysis::toString() const {
  std::string out = write.toString();
  out += read.toString();
  for (const ScalingObservation& obs : observations) {
    out += fmt::format("  - {}\n", obs.description);
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

ScalingAnalysis analyzeScaling(std::span<const ScalingInput> inputs, const ScalingConfig& config) {
  std::vector<ScalingInput> sorted(inputs.begin(), inputs.end());
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const ScalingInput& a, const ScalingInput& b) { return a.threads < b.threads; });

  ScalingAnalysis out;
  out.write = analyzeDirection(sorted, ScalingDirection::WRITE);
  out.read = analyzeDirection(sorted, ScalingDirection::READ);
  observe(out.write, config, out.observations);
  observe(out.read, config, out.observations);
  return out;
}

} // namespace telemetry

} // namespace poolscope
