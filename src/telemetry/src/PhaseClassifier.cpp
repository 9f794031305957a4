/**
 * @file PhaseClassifier.cpp
 * @brief Implementation of phase classification and I/O size analysis.
 */

#include "src/telemetry/inc/PhaseClassifier.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <utility>

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

using helpers::strings::endsWith;

/* ----------------------------- Classification ----------------------------- */

Phase classifyPhase(const PoolSample& sample, const ClassifierConfig& config) noexcept {
  const bool READING = sample.readBandwidthMBps > config.idleEpsilonMBps;
  const bool WRITING = sample.writeBandwidthMBps > config.idleEpsilonMBps;

  if (READING && WRITING) {
    return Phase::MIXED;
  }
  if (READING) {
    return Phase::READ;
  }
  if (WRITING) {
    return Phase::WRITE;
  }
  return Phase::IDLE;
}

Phase classifyPhase(const ArcSample& sample) noexcept { return phaseFromLabel(sample.segmentLabel); }

Phase phaseFromLabel(std::string_view label) noexcept {
  if (endsWith(label, "-read")) {
    return Phase::READ;
  }
  if (endsWith(label, "-write")) {
    return Phase::WRITE;
  }
  return Phase::IDLE;
}

bool isSteadyStateLabel(std::string_view label) noexcept {
  return !label.empty() && label != WARMUP_LABEL && label != COOLDOWN_LABEL;
}

/* ----------------------------- PhaseBreakdown ----------------------------- */

std::size_t PhaseBreakdown::count(Phase phase) const noexcept {
  return counts[static_cast<std::size_t>(phase)];
}

double PhaseBreakdown::percent(Phase phase) const noexcept {
  if (total == 0) {
    return 0.0;
  }
  return static_cast<double>(count(phase)) / static_cast<double>(total) * 100.0;
}

std::string PhaseBreakdown::toString() const {
  std::string out;
  for (std::size_t i = 0; i < PHASE_COUNT; ++i) {
    const Phase P = static_cast<Phase>(i);
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += fmt::format("{}={} ({:.1f}%)", telemetry::toString(P), count(P), percent(P));
  }
  return out;
}

PhaseBreakdown phaseBreakdown(std::span<const PoolSample> samples) noexcept {
  PhaseBreakdown out;
  for (const PoolSample& s : samples) {
    ++out.counts[static_cast<std::size_t>(s.phase)];
  }
  out.total = samples.size();
  return out;
}

/* ----------------------------- I/O Size ----------------------------- */

std::string IoSizeStats::toString() const {
  return fmt::format("{}: {} samples, read {:.1f} KiB/op (n={}), write {:.1f} KiB/op (n={})",
                     telemetry::toString(phase), sampleCount, readKiBPerOp.mean,
                     readKiBPerOp.count, writeKiBPerOp.mean, writeKiBPerOp.count);
}

std::vector<IoSizeStats> computeIoSizeByPhase(std::span<const PoolSample> samples) {
  constexpr std::array<Phase, 3> ACTIVE{Phase::READ, Phase::WRITE, Phase::MIXED};
  // MB/s per op/s -> KiB per op
  constexpr double KIB_PER_MB = 1024.0;

  std::vector<IoSizeStats> out;
  for (Phase phase : ACTIVE) {
    std::vector<double> readSizes;
    std::vector<double> writeSizes;
    std::size_t n = 0;

    for (const PoolSample& s : samples) {
      if (s.phase != phase) {
        continue;
      }
      ++n;
      if (s.readIops > 0.0) {
        readSizes.push_back(s.readBandwidthMBps * KIB_PER_MB / s.readIops);
      }
      if (s.writeIops > 0.0) {
        writeSizes.push_back(s.writeBandwidthMBps * KIB_PER_MB / s.writeIops);
      }
    }

    if (n == 0) {
      continue;
    }

    IoSizeStats entry;
    entry.phase = phase;
    entry.sampleCount = n;
    entry.readKiBPerOp = computeStats(readSizes);
    entry.writeKiBPerOp = computeStats(writeSizes);
    out.push_back(std::move(entry));
  }
  return out;
}

} // namespace telemetry

} // namespace poolscope
