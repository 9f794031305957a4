#ifndef POOLSCOPE_TELEMETRY_PHASE_CLASSIFIER_HPP
#define POOLSCOPE_TELEMETRY_PHASE_CLASSIFIER_HPP
/**
 * @file PhaseClassifier.hpp
 * @brief Activity classification, steady-state filtering and I/O size analysis.
 * @note Thread-safe: Pure functions.
 */

#include "src/telemetry/inc/Sample.hpp"
#include "src/telemetry/inc/Statistics.hpp"

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Config ----------------------------- */

/**
 * @brief Classifier thresholds.
 */
struct ClassifierConfig {
  /// Bandwidth at or below this counts as no activity in that direction.
  double idleEpsilonMBps{0.5};
};

/* ----------------------------- Classification ----------------------------- */

/**
 * @brief Classify a pool sample by which directions carry bandwidth.
 * @return IDLE (neither above epsilon), READ, WRITE or MIXED (both).
 */
[[nodiscard]] Phase classifyPhase(const PoolSample& sample,
                                  const ClassifierConfig& config = {}) noexcept;

/**
 * @brief Classify an ARC sample from its segment label.
 * @return phaseFromLabel(sample.segmentLabel).
 */
[[nodiscard]] Phase classifyPhase(const ArcSample& sample) noexcept;

/**
 * @brief Derive the phase a driver label denotes.
 * @return READ for a "-read" suffix, WRITE for "-write", IDLE otherwise.
 */
[[nodiscard]] Phase phaseFromLabel(std::string_view label) noexcept;

/**
 * @brief True for labels that belong to a measurement segment.
 * @return false for "", WARMUP_LABEL and COOLDOWN_LABEL.
 */
[[nodiscard]] bool isSteadyStateLabel(std::string_view label) noexcept;

/* ----------------------------- Phase Breakdown ----------------------------- */

/**
 * @brief Sample counts per phase.
 */
struct PhaseBreakdown {
  std::array<std::size_t, PHASE_COUNT> counts{};
  std::size_t total{0};

  /// @brief Samples classified as @p phase.
  [[nodiscard]] std::size_t count(Phase phase) const noexcept;

  /// @brief Share of @p phase in [0, 100]; 0 for an empty breakdown.
  [[nodiscard]] double percent(Phase phase) const noexcept;

  /// @brief e.g. "idle=2 (10.0%) read=8 (40.0%) write=10 (50.0%) mixed=0 (0.0%)".
  [[nodiscard]] std::string toString() const;
};

/// @brief Count samples by their recorded phase.
[[nodiscard]] PhaseBreakdown phaseBreakdown(std::span<const PoolSample> samples) noexcept;

/* ----------------------------- I/O Size ----------------------------- */

/**
 * @brief Average request size per phase, derived as bandwidth / IOPS.
 */
struct IoSizeStats {
  Phase phase{Phase::IDLE};
  std::size_t sampleCount{0}; ///< Samples in this phase
  Stats readKiBPerOp{};       ///< Over samples with readIops > 0
  Stats writeKiBPerOp{};      ///< Over samples with writeIops > 0

  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Per-phase request size statistics.
 * @return One entry per non-IDLE phase that has samples, in READ, WRITE, MIXED order.
 */
[[nodiscard]] std::vector<IoSizeStats> computeIoSizeByPhase(std::span<const PoolSample> samples);

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_PHASE_CLASSIFIER_HPP
