#ifndef POOLSCOPE_TELEMETRY_STATISTICS_HPP
#define POOLSCOPE_TELEMETRY_STATISTICS_HPP
/**
 * @file Statistics.hpp
 * @brief Descriptive statistics over a series of metric values.
 * @note Thread-safe: Pure function, sorts a private copy.
 *
 * Conventions:
 *  - stddev is the sample (n-1) deviation; 0 for a single value
 *  - percentiles interpolate linearly at index p * (n - 1)
 *  - median is p50
 *  - cvPercent is stddev / mean * 100, or 0 with cvDefined=false when mean is 0
 */

#include <cstddef>
#include <span>
#include <string>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Stats ----------------------------- */

/**
 * @brief Summary of one metric series. All fields are 0 for an empty series.
 */
struct Stats {
  std::size_t count{0};
  double mean{0.0};
  double median{0.0};
  double min{0.0};
  double max{0.0};
  double stddev{0.0};
  double p50{0.0};
  double p75{0.0};
  double p90{0.0};
  double p95{0.0};
  double p99{0.0};
  double cvPercent{0.0}; ///< Coefficient of variation
  bool cvDefined{false}; ///< False when mean is 0 (cvPercent forced to 0)

  /// @brief True if no values contributed.
  [[nodiscard]] bool empty() const noexcept { return count == 0; }

  /// @brief e.g. "n=5 mean=3.00 p50=3.00 p99=4.96 min=1.00 max=5.00 sd=1.58 cv=52.7%".
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Compute summary statistics.
 * @param values Metric values in any order. Non-finite entries are skipped.
 * @return Populated Stats; zeroed for an empty (or all non-finite) series.
 */
[[nodiscard]] Stats computeStats(std::span<const double> values);

/**
 * @brief Linear-interpolated percentile of an ascending series.
 * @param sorted Values sorted ascending (must be non-empty).
 * @param p      Fraction in [0, 1].
 */
[[nodiscard]] double percentileSorted(std::span<const double> sorted, double p) noexcept;

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_STATISTICS_HPP
