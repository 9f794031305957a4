#ifndef POOLSCOPE_TELEMETRY_SCALING_ANALYZER_HPP
#define POOLSCOPE_TELEMETRY_SCALING_ANALYZER_HPP
/**
 * @file ScalingAnalyzer.hpp
 * @brief Throughput scaling across thread counts.
 * @note Thread-safe: Pure function.
 *
 * Inputs are the driver's own per-configuration average speeds, one entry per
 * thread count. Each direction (write, read) is analyzed independently:
 *  - peak speed and the thread count that reached it (first maximum wins)
 *  - thread efficiency = peak speed / peak threads
 *  - consecutive deltas with percent change
 *  - neutral observations (peak, negative transitions, diminishing returns)
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Driver-supplied averages for one thread count.
 */
struct ScalingInput {
  std::uint32_t threads{0};
  double avgWriteMBps{0.0};
  double avgReadMBps{0.0};
};

/**
 * @brief One thread count's speed in one direction.
 */
struct ScalingPoint {
  std::uint32_t threads{0};
  double speedMBps{0.0};
  double vsSingleThread{0.0}; ///< speed / speed at the lowest thread count (0 if that is 0)
};

/**
 * @brief Change between two consecutive thread counts.
 */
struct ScalingDelta {
  std::uint32_t fromThreads{0};
  std::uint32_t toThreads{0};
  double deltaSpeed{0.0};     ///< to - from (MB/s)
  double percentChange{0.0};  ///< delta / from * 100; 0 when from is 0
  bool percentDefined{false}; ///< False when the from speed is 0

  /// @brief True for a throughput loss.
  [[nodiscard]] bool isNegative() const noexcept { return deltaSpeed < 0.0; }
};

/**
 * @brief Workload direction.
 */
enum class ScalingDirection : std::uint8_t {
  WRITE = 0,
  READ,
};

/// @brief "write" or "read".
[[nodiscard]] const char* toString(ScalingDirection direction) noexcept;

/**
 * @brief Scaling analysis of one direction.
 */
struct DirectionScaling {
  ScalingDirection direction{ScalingDirection::WRITE};
  std::vector<ScalingPoint> points; ///< Ascending thread count
  double peakSpeedMBps{0.0};
  std::uint32_t peakThreads{0};
  double threadEfficiency{0.0}; ///< MB/s per thread at the peak
  std::vector<ScalingDelta> deltas;
  std::size_t positiveTransitions{0};
  std::size_t negativeTransitions{0};

  /// @brief Multi-line table.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Kind of scaling observation.
 */
enum class ObservationKind : std::uint8_t {
  PEAK = 0,
  NEGATIVE_TRANSITION,
  DIMINISHING_RETURNS,
};

/// @brief Human-readable kind name.
[[nodiscard]] const char* toString(ObservationKind kind) noexcept;

/**
 * @brief One neutral statement about the scaling curve.
 */
struct ScalingObservation {
  ObservationKind kind{ObservationKind::PEAK};
  ScalingDirection direction{ScalingDirection::WRITE};
  std::uint32_t fromThreads{0};
  std::uint32_t toThreads{0}; ///< For PEAK, the peak thread count
  double percentChange{0.0};
  std::string description;
};

/**
 * @brief Observation thresholds.
 */
struct ScalingConfig {
  /// A positive transition below this percent may be diminishing returns.
  double diminishingThresholdPct{5.0};
  /// ...when the transition before it gained at least this percent.
  double priorGainPct{20.0};
};

/**
 * @brief Both directions plus observations.
 */
struct ScalingAnalysis {
  DirectionScaling write{};
  DirectionScaling read{};
  std::vector<ScalingObservation> observations; ///< Write first, then read

  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Analyze throughput scaling.
 * @param inputs One entry per thread count, any order (stable-sorted by threads).
 * @param config Observation thresholds.
 * @return Analysis; empty directions for empty input.
 */
[[nodiscard]] ScalingAnalysis analyzeScaling(std::span<const ScalingInput> inputs,
                                             const ScalingConfig& config = {});

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_SCALING_ANALYZER_HPP
