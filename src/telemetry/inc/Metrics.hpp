#ifndef POOLSCOPE_TELEMETRY_METRICS_HPP
#define POOLSCOPE_TELEMETRY_METRICS_HPP
/**
 * @file Metrics.hpp
 * @brief Named metric accessors over pool and ARC samples.
 *
 * Statistics and anomaly detection iterate these tables instead of naming
 * sample members directly, so every metric is reported under one stable name.
 */

#include "src/telemetry/inc/Sample.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Kind of quantity a metric measures.
 */
enum class MetricFamily : std::uint8_t {
  IOPS = 0,
  BANDWIDTH, ///< MB/s
  LATENCY,   ///< ms
  PERCENT,
  SIZE, ///< GiB
  RATE, ///< events/s
};

/// @brief Human-readable family name.
[[nodiscard]] constexpr const char* toString(MetricFamily family) noexcept {
  switch (family) {
  case MetricFamily::IOPS:
    return "iops";
  case MetricFamily::BANDWIDTH:
    return "bandwidth";
  case MetricFamily::LATENCY:
    return "latency";
  case MetricFamily::PERCENT:
    return "percent";
  case MetricFamily::SIZE:
    return "size";
  case MetricFamily::RATE:
    return "rate";
  }
  return "unknown";
}

/**
 * @brief One named metric of a sample type.
 * @tparam SampleT PoolSample or ArcSample.
 */
template <typename SampleT> struct MetricDef {
  std::string_view name;
  MetricFamily family;
  double (*get)(const SampleT&) noexcept;
  bool l2arcOnly{false}; ///< Skipped for runs without L2ARC
};

/* ----------------------------- Pool Metrics ----------------------------- */

inline constexpr std::array<MetricDef<PoolSample>, 14> POOL_METRICS{{
    {"read_iops", MetricFamily::IOPS, [](const PoolSample& s) noexcept { return s.readIops; }},
    {"write_iops", MetricFamily::IOPS, [](const PoolSample& s) noexcept { return s.writeIops; }},
    {"total_iops", MetricFamily::IOPS,
     [](const PoolSample& s) noexcept { return s.readIops + s.writeIops; }},
    {"read_bandwidth_mbps", MetricFamily::BANDWIDTH,
     [](const PoolSample& s) noexcept { return s.readBandwidthMBps; }},
    {"write_bandwidth_mbps", MetricFamily::BANDWIDTH,
     [](const PoolSample& s) noexcept { return s.writeBandwidthMBps; }},
    {"total_bandwidth_mbps", MetricFamily::BANDWIDTH,
     [](const PoolSample& s) noexcept { return s.readBandwidthMBps + s.writeBandwidthMBps; }},
    {"total_wait_read_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.read.totalWaitMs; }},
    {"total_wait_write_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.write.totalWaitMs; }},
    {"disk_wait_read_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.read.diskWaitMs; }},
    {"disk_wait_write_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.write.diskWaitMs; }},
    {"syncq_wait_read_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.read.syncQueueWaitMs; }},
    {"syncq_wait_write_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.write.syncQueueWaitMs; }},
    {"asyncq_wait_read_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.read.asyncQueueWaitMs; }},
    {"asyncq_wait_write_ms", MetricFamily::LATENCY,
     [](const PoolSample& s) noexcept { return s.write.asyncQueueWaitMs; }},
}};

/* ----------------------------- ARC Metrics ----------------------------- */

inline constexpr std::array<MetricDef<ArcSample>, 14> ARC_METRICS{{
    {"arc_hit_pct", MetricFamily::PERCENT, [](const ArcSample& s) noexcept { return s.hitPct; }},
    {"arc_miss_pct", MetricFamily::PERCENT, [](const ArcSample& s) noexcept { return s.missPct; }},
    {"arc_size_gib", MetricFamily::SIZE, [](const ArcSample& s) noexcept { return s.arcSizeGiB; }},
    {"arc_reads_per_sec", MetricFamily::RATE,
     [](const ArcSample& s) noexcept { return s.readsPerSec; }},
    {"arc_hits_per_sec", MetricFamily::RATE,
     [](const ArcSample& s) noexcept { return s.hitsPerSec; }},
    {"arc_misses_per_sec", MetricFamily::RATE,
     [](const ArcSample& s) noexcept { return s.missesPerSec; }},
    {"demand_hit_pct", MetricFamily::PERCENT,
     [](const ArcSample& s) noexcept { return s.demandHitPct; }},
    {"prefetch_hit_pct", MetricFamily::PERCENT,
     [](const ArcSample& s) noexcept { return s.prefetchHitPct; }},
    {"mru_pct", MetricFamily::PERCENT, [](const ArcSample& s) noexcept { return s.mruPct; }},
    {"mfu_pct", MetricFamily::PERCENT, [](const ArcSample& s) noexcept { return s.mfuPct; }},
    {"zfetch_hit_pct", MetricFamily::PERCENT,
     [](const ArcSample& s) noexcept { return s.zfetchHitPct; }},
    {"l2arc_hit_pct", MetricFamily::PERCENT,
     [](const ArcSample& s) noexcept { return s.l2arcHitPct.value_or(0.0); }, true},
    {"l2arc_size_gib", MetricFamily::SIZE,
     [](const ArcSample& s) noexcept { return s.l2arcSizeGiB.value_or(0.0); }, true},
    {"l2arc_read_mbps", MetricFamily::BANDWIDTH,
     [](const ArcSample& s) noexcept { return s.l2arcReadMBps.value_or(0.0); }, true},
}};

/* ----------------------------- Helpers ----------------------------- */

/**
 * @brief Extract one metric from every sample.
 */
template <typename SampleT>
[[nodiscard]] std::vector<double> extractMetric(std::span<const SampleT> samples,
                                                const MetricDef<SampleT>& metric) {
  std::vector<double> out;
  out.reserve(samples.size());
  for (const SampleT& s : samples) {
    out.push_back(metric.get(s));
  }
  return out;
}

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_METRICS_HPP
