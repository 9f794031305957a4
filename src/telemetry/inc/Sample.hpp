#ifndef POOLSCOPE_TELEMETRY_SAMPLE_HPP
#define POOLSCOPE_TELEMETRY_SAMPLE_HPP
/**
 * @file Sample.hpp
 * @brief Telemetry sample records and the per-run telemetry container.
 * @note Thread-safe: Plain value types. Synchronization is the collector's job.
 *
 * Two sample families exist:
 *  - PoolSample: one `zpool iostat -l` report line (IOPS, bandwidth, latency)
 *  - ArcSample:  one `arcstat -p` report line (ARC / L2ARC / prefetch)
 *
 * Canonical units: bandwidth MB/s (2^20 bytes/s), latency ms, sizes GiB.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Constants ----------------------------- */

/// Label carried by samples captured while the collector is warming up.
inline constexpr std::string_view WARMUP_LABEL = "warmup";

/// Label carried by samples captured while the collector is cooling down.
inline constexpr std::string_view COOLDOWN_LABEL = "cooldown";

/* ----------------------------- Phase ----------------------------- */

/**
 * @brief I/O activity class of one sample.
 */
enum class Phase : std::uint8_t {
  IDLE = 0,
  READ,
  WRITE,
  MIXED,
};

/// Number of Phase enumerators.
inline constexpr std::size_t PHASE_COUNT = 4;

/// @brief Human-readable phase name ("idle", "read", "write", "mixed").
[[nodiscard]] const char* toString(Phase phase) noexcept;

/* ----------------------------- ParseWarning ----------------------------- */

/**
 * @brief One field that could not be parsed and was zeroed.
 */
struct ParseWarning {
  std::size_t column{0}; ///< Zero-based column index in the raw line
  std::string field;     ///< Column name from the layout table
  std::string token;     ///< Offending raw token

  /// @brief e.g. "column 5 (read_bw): unparsable token '1.2X'".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- PoolSample ----------------------------- */

/**
 * @brief Latency breakdown for one I/O direction (milliseconds).
 */
struct LatencySet {
  double totalWaitMs{0.0};      ///< Total I/O time (queue + disk)
  double diskWaitMs{0.0};       ///< Disk service time
  double syncQueueWaitMs{0.0};  ///< Time in the sync queue
  double asyncQueueWaitMs{0.0}; ///< Time in the async queue
};

/**
 * @brief One pool-level iostat observation.
 */
struct PoolSample {
  std::uint64_t timestampNs{0}; ///< Capture time (realtime clock, strictly increasing)
  std::string segmentLabel;     ///< Driver segment, or WARMUP_LABEL / COOLDOWN_LABEL
  Phase phase{Phase::IDLE};     ///< Classified activity

  std::string poolName; ///< Pool column as reported
  double allocGiB{0.0}; ///< Allocated capacity
  double freeGiB{0.0};  ///< Free capacity

  double readIops{0.0};           ///< Read operations per second
  double writeIops{0.0};          ///< Write operations per second
  double readBandwidthMBps{0.0};  ///< Read bandwidth
  double writeBandwidthMBps{0.0}; ///< Write bandwidth

  LatencySet read{};  ///< Read latency breakdown
  LatencySet write{}; ///< Write latency breakdown

  double scrubWaitMs{0.0}; ///< Scrub queue wait (0 when not reported)
  double trimWaitMs{0.0};  ///< Trim queue wait (0 when not reported)

  /// @brief Read + write IOPS.
  [[nodiscard]] double totalIops() const noexcept;

  /// @brief Read + write bandwidth.
  [[nodiscard]] double totalBandwidthMBps() const noexcept;

  /// @brief One-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- ArcSample ----------------------------- */

/**
 * @brief One ARC statistics observation.
 *
 * The l2arc* members are engaged on every sample of a run whose collector was
 * configured with L2ARC present, and on none otherwise.
 */
struct ArcSample {
  std::uint64_t timestampNs{0};
  std::string segmentLabel;
  Phase phase{Phase::IDLE};

  double hitPct{0.0};         ///< ARC hit ratio
  double missPct{0.0};        ///< ARC miss ratio
  double arcSizeGiB{0.0};     ///< Current ARC size
  double readsPerSec{0.0};    ///< ARC accesses per second
  double hitsPerSec{0.0};     ///< ARC hits per second
  double missesPerSec{0.0};   ///< ARC misses per second
  double demandHitPct{0.0};   ///< Demand data hit ratio
  double prefetchHitPct{0.0}; ///< Prefetch data hit ratio
  double mruPct{0.0};         ///< MRU list share of ARC size
  double mfuPct{0.0};         ///< MFU list share of ARC size
  double zfetchHitPct{0.0};   ///< Prefetch engine hits / (hits + misses)

  std::optional<double> l2arcHitPct;   ///< L2ARC hit ratio
  std::optional<double> l2arcSizeGiB;  ///< L2ARC size
  std::optional<double> l2arcReadMBps; ///< L2ARC read throughput

  /// @brief True if the L2ARC fields are engaged.
  [[nodiscard]] bool hasL2arc() const noexcept;

  /// @brief One-line summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Telemetry ----------------------------- */

/**
 * @brief Everything one collector captured during one benchmark run.
 * @tparam SampleT PoolSample or ArcSample.
 */
template <typename SampleT> struct Telemetry {
  std::string source;           ///< Collector name, e.g. "iostat(tank)"
  std::vector<SampleT> samples; ///< Ordered by timestampNs
  std::uint64_t startNs{0};     ///< Realtime clock at start()
  std::uint64_t endNs{0};       ///< Realtime clock at stop()
  std::size_t warmupTarget{0};   ///< Requested warmup samples
  std::size_t cooldownTarget{0}; ///< Requested cooldown samples
  std::size_t restarts{0};       ///< Source restarts performed
  bool complete{false};          ///< False if the source died for good or never started
  bool sourceUnavailable{false}; ///< True if the tool could not be spawned

  std::size_t parseWarningCount{0};       ///< Total fields zeroed
  std::vector<ParseWarning> parseWarnings; ///< First warnings (bounded)

  /// @brief Wall time between start and stop (0 if not stopped).
  [[nodiscard]] double durationSec() const noexcept {
    if (endNs <= startNs) {
      return 0.0;
    }
    return static_cast<double>(endNs - startNs) / 1.0e9;
  }

  /// @brief Copy of the samples carrying @p label.
  [[nodiscard]] std::vector<SampleT> samplesForSegment(std::string_view label) const {
    std::vector<SampleT> out;
    for (const SampleT& s : samples) {
      if (s.segmentLabel == label) {
        out.push_back(s);
      }
    }
    return out;
  }
};

using PoolTelemetry = Telemetry<PoolSample>;
using ArcTelemetry = Telemetry<ArcSample>;

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_SAMPLE_HPP
