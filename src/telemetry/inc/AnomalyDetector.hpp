#ifndef POOLSCOPE_TELEMETRY_ANOMALY_DETECTOR_HPP
#define POOLSCOPE_TELEMETRY_ANOMALY_DETECTOR_HPP
/**
 * @file AnomalyDetector.hpp
 * @brief Z-score outlier detection over metric series.
 * @note Thread-safe: Pure functions.
 *
 * A point is anomalous when |value - mean| / stddev > zThreshold (strict).
 * A series with zero spread or fewer than two points has no anomalies.
 */

#include "src/telemetry/inc/Sample.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Side of the mean an anomaly falls on.
 */
enum class AnomalyDirection : std::uint8_t {
  SPIKE = 0, ///< Above the mean
  DROP,      ///< Below the mean
};

/// @brief "spike" or "drop".
[[nodiscard]] const char* toString(AnomalyDirection direction) noexcept;

/**
 * @brief One flagged observation.
 */
struct AnomalyRecord {
  std::uint64_t timestampNs{0};
  std::string metric;
  double value{0.0};
  double zScore{0.0}; ///< Signed
  AnomalyDirection direction{AnomalyDirection::SPIKE};

  /// @brief e.g. "write_bandwidth_mbps spike 950.00 (z=3.41)".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief One (time, value) point of a metric series.
 */
struct MetricPoint {
  std::uint64_t timestampNs{0};
  double value{0.0};
};

/**
 * @brief Detection parameters.
 */
struct AnomalyConfig {
  double zThreshold{3.0}; ///< Flag when |z| is strictly greater

  /// @brief Looser preset for short runs.
  [[nodiscard]] static AnomalyConfig sensitive() noexcept { return AnomalyConfig{2.0}; }
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Flag points of one series whose z-score exceeds the threshold.
 * @param series Points in time order.
 * @param metric Name copied into each record.
 * @param config Threshold.
 * @return Records in series order.
 */
[[nodiscard]] std::vector<AnomalyRecord> detectAnomalies(std::span<const MetricPoint> series,
                                                         std::string_view metric,
                                                         const AnomalyConfig& config = {});

/**
 * @brief Run detection over every pool metric independently.
 * @return Records grouped by metric (POOL_METRICS order), then by time.
 */
[[nodiscard]] std::vector<AnomalyRecord> detectPoolAnomalies(std::span<const PoolSample> samples,
                                                             const AnomalyConfig& config = {});

/**
 * @brief Run detection over every ARC metric independently.
 * @param hasL2arc When false the L2ARC metrics are skipped.
 */
[[nodiscard]] std::vector<AnomalyRecord> detectArcAnomalies(std::span<const ArcSample> samples,
                                                            bool hasL2arc,
                                                            const AnomalyConfig& config = {});

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_ANOMALY_DETECTOR_HPP
