#ifndef POOLSCOPE_TELEMETRY_LATENCY_SCALER_HPP
#define POOLSCOPE_TELEMETRY_LATENCY_SCALER_HPP
/**
 * @file LatencyScaler.hpp
 * @brief Millisecond / microsecond presentation of latency statistics.
 *
 * Sub-millisecond means are shown in microseconds so that fast devices do
 * not print as a column of "0.00". The decision is made once per Stats block
 * so every figure in it shares one unit.
 */

#include "src/telemetry/inc/Statistics.hpp"

#include <cstdint>
#include <string>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Display unit chosen for a latency block.
 */
enum class LatencyUnit : std::uint8_t {
  MILLISECONDS = 0,
  MICROSECONDS,
};

/// @brief Unit suffix ("ms" or "us").
[[nodiscard]] const char* toString(LatencyUnit unit) noexcept;

/**
 * @brief Latency Stats converted to a display unit.
 */
struct ScaledStats {
  LatencyUnit unit{LatencyUnit::MILLISECONDS};
  Stats stats{}; ///< Figures in @ref unit; count and cvPercent unchanged

  /// @brief e.g. "mean=250.00us p99=900.00us max=1200.00us".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Choose the display unit for latency stats given in milliseconds.
 * @param msStats Stats computed over millisecond values.
 * @return MICROSECONDS with every figure x1000 when mean < 1 ms, else unchanged.
 */
[[nodiscard]] ScaledStats scaleLatency(const Stats& msStats) noexcept;

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_LATENCY_SCALER_HPP
