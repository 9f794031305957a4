/**
 * @file Sample.cpp
 * @brief Sample record helpers.
 */

#include "src/telemetry/inc/Sample.hpp"

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Phase ----------------------------- */

const char* toString(Phase phase) noexcept {
  switch (phase) {
  case Phase::IDLE:
    return "idle";
  case Phase::READ:
    return "read";
  case Phase::WRITE:
    return "write";
  case Phase::MIXED:
    return "mixed";
  }
  return "unknown";
}

/* ----------------------------- ParseWarning Methods ----------------------------- */

std::string ParseWarning::toString() const {
  return fmt::format("column {} ({}): unparsable token '{}'", column, field, token);
}

/* ----------------------------- PoolSample Methods ----------------------------- */

double PoolSample::totalIops() const noexcept { return readIops + writeIops; }

double PoolSample::totalBandwidthMBps() const noexcept {
  return readBandwidthMBps + writeBandwidthMBps;
}

std::string PoolSample::toString() const {
  return fmt::format("[{}] {} {}: {:.0f} r/s {:.0f} w/s | r={:.1f} w={:.1f} MB/s | "
                     "r_wait={:.3f}ms w_wait={:.3f}ms",
                     segmentLabel, poolName, telemetry::toString(phase), readIops, writeIops,
                     readBandwidthMBps, writeBandwidthMBps, read.totalWaitMs, write.totalWaitMs);
}

/* ----------------------------- ArcSample Methods ----------------------------- */

bool ArcSample::hasL2arc() const noexcept { return l2arcHitPct.has_value(); }

std::string ArcSample::toString() const {
  std::string out = fmt::format("[{}] hit={:.1f}% size={:.2f}GiB mru={:.1f}% mfu={:.1f}% "
                                "zfetch={:.1f}%",
                                segmentLabel, hitPct, arcSizeGiB, mruPct, mfuPct, zfetchHitPct);
  if (hasL2arc()) {
    out += fmt::format(" l2hit={:.1f}% l2size={:.2f}GiB", *l2arcHitPct, l2arcSizeGiB.value_or(0.0));
  }
  return out;
}

} // namespace telemetry

} // namespace poolscope
