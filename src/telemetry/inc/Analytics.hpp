#ifndef POOLSCOPE_TELEMETRY_ANALYTICS_HPP
#define POOLSCOPE_TELEMETRY_ANALYTICS_HPP
/**
 * @file Analytics.hpp
 * @brief Per-segment statistics and run-level summaries over captured telemetry.
 * @note Thread-safe: Pure functions of their inputs.
 *
 * Steady-state samples are those whose label passes isSteadyStateLabel();
 * warmup, cooldown and unlabelled samples only contribute to "overall" figures.
 */

#include "src/telemetry/inc/AnomalyDetector.hpp"
#include "src/telemetry/inc/Metrics.hpp"
#include "src/telemetry/inc/PhaseClassifier.hpp"
#include "src/telemetry/inc/Sample.hpp"
#include "src/telemetry/inc/ScalingAnalyzer.hpp"
#include "src/telemetry/inc/Statistics.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Statistics of one named metric.
 */
struct MetricStats {
  std::string metric;
  MetricFamily family{MetricFamily::IOPS};
  Stats stats{};
};

/**
 * @brief Statistics of every metric within one driver segment.
 */
struct SegmentStats {
  std::string segmentLabel;
  std::size_t sampleCount{0};
  Phase phase{Phase::IDLE}; ///< Most frequent phase (lowest enumerator on ties)
  std::vector<MetricStats> metrics;

  /// @brief Stats for @p metric, or nullptr if not present.
  [[nodiscard]] const MetricStats* find(std::string_view metric) const noexcept;

  /// @brief Multi-line table; latency metrics shown in ms or us.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Analysis parameters.
 */
struct AnalyticsConfig {
  AnomalyConfig anomaly{};
  ScalingConfig scaling{};
};

/**
 * @brief Allocated pool space over a run, GiB.
 */
struct CapacityStats {
  std::size_t count{0}; ///< Samples contributing
  double startGiB{0.0}; ///< First sample
  double endGiB{0.0};   ///< Last sample
  double minGiB{0.0};
  double maxGiB{0.0};

  /// @brief Growth from first to last sample.
  [[nodiscard]] double deltaGiB() const noexcept { return endGiB - startGiB; }

  /// @brief e.g. "start=1536.00 end=1540.00 min=1536.00 peak=1541.00 GiB".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Everything derived from one pool iostat run.
 */
struct PoolSummary {
  std::string source;
  bool complete{false};
  double durationSec{0.0};
  std::size_t sampleCount{0};
  std::size_t steadyStateCount{0};
  std::size_t parseWarningCount{0};
  std::vector<MetricStats> overall;     ///< All samples
  std::vector<MetricStats> steadyState; ///< Steady-state samples only
  std::vector<SegmentStats> segments;   ///< First-appearance order
  PhaseBreakdown phases{};              ///< All samples
  CapacityStats capacity{};             ///< All samples
  std::vector<IoSizeStats> ioSize;      ///< Steady-state samples
  std::vector<AnomalyRecord> anomalies; ///< Steady-state samples

  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Everything derived from one arcstat run.
 *
 * ARC behaviour is most telling while data is read back, so the focused
 * figures cover READ-phase (label "...-read") segments.
 */
struct ArcSummary {
  std::string source;
  bool complete{false};
  bool hasL2arc{false};
  double durationSec{0.0};
  std::size_t sampleCount{0};
  std::size_t readPhaseCount{0};
  std::vector<MetricStats> overall;     ///< All samples
  std::vector<MetricStats> readPhase;   ///< Steady-state READ samples
  std::vector<SegmentStats> readSegments;
  std::vector<AnomalyRecord> anomalies; ///< Steady-state samples

  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Pool, optional ARC and scaling analysis of one benchmark run.
 */
struct RunAnalysis {
  PoolSummary pool{};
  std::optional<ArcSummary> arc;
  ScalingAnalysis scaling{};

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Allocated-space start, end and extremes over @p samples.
 * @return count == 0 for an empty span.
 */
[[nodiscard]] CapacityStats computeCapacity(std::span<const PoolSample> samples) noexcept;

/**
 * @brief Per-segment pool statistics.
 * @return One entry per steady-state label, in order of first appearance.
 */
[[nodiscard]] std::vector<SegmentStats> computeSegmentStats(std::span<const PoolSample> samples);

/**
 * @brief Per-segment ARC statistics.
 * @param hasL2arc When false the L2ARC metrics are omitted.
 */
[[nodiscard]] std::vector<SegmentStats> computeSegmentStats(std::span<const ArcSample> samples,
                                                            bool hasL2arc);

/// @brief Steady-state samples in capture order.
[[nodiscard]] std::vector<PoolSample> steadyStateSamples(std::span<const PoolSample> samples);

/// @brief Summarize a pool iostat run.
[[nodiscard]] PoolSummary summarizePool(const PoolTelemetry& telemetry,
                                        const AnalyticsConfig& config = {});

/// @brief Summarize an arcstat run.
[[nodiscard]] ArcSummary summarizeArc(const ArcTelemetry& telemetry,
                                      const AnalyticsConfig& config = {});

/**
 * @brief Full run analysis.
 * @param pool    Pool telemetry.
 * @param arc     ARC telemetry, or nullptr when not collected.
 * @param scaling Driver-supplied per-thread-count averages.
 */
[[nodiscard]] RunAnalysis analyzeRun(const PoolTelemetry& pool, const ArcTelemetry* arc,
                                     std::span<const ScalingInput> scaling,
                                     const AnalyticsConfig& config = {});

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_ANALYTICS_HPP
