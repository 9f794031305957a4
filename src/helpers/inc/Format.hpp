#ifndef POOLSCOPE_HELPERS_FORMAT_HPP
#define POOLSCOPE_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for telemetry figures and timestamps.
 *
 * Provides consistent formatting across toString() methods and CLI output.
 * Uses fmt library for string formatting.
 *
 * @note All functions return std::string (heap allocation).
 *       Use only in cold paths (CLI output, logging, etc.).
 */

#include <cstdint>
#include <ctime>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace poolscope {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format a realtime nanosecond timestamp as UTC ISO-8601.
 * @param ns Nanoseconds since the Unix epoch.
 * @return e.g. "2024-05-01T12:00:03.250Z" (millisecond precision).
 */
[[nodiscard]] inline std::string isoTimestamp(std::uint64_t ns) {
  const std::time_t SECS = static_cast<std::time_t>(ns / 1'000'000'000ULL);
  const unsigned MILLIS = static_cast<unsigned>((ns / 1'000'000ULL) % 1000ULL);

  struct tm utc{};
  if (::gmtime_r(&SECS, &utc) == nullptr) {
    return fmt::format("{}ns", ns);
  }

  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z", utc.tm_year + 1900,
                     utc.tm_mon + 1, utc.tm_mday, utc.tm_hour, utc.tm_min, utc.tm_sec, MILLIS);
}

/**
 * @brief Format throughput given in MB/s, promoting to GB/s above 1024.
 * @param mbps Throughput in MB/s (2^20 bytes per second).
 * @return Formatted string (e.g., "512.0 MB/s", "1.50 GB/s").
 */
[[nodiscard]] inline std::string megabytesPerSec(double mbps) {
  if (mbps >= 1024.0) {
    return fmt::format("{:.2f} GB/s", mbps / 1024.0);
  }
  return fmt::format("{:.1f} MB/s", mbps);
}

/**
 * @brief Format a statistic for tabular output.
 * @param value Value to format.
 * @return No decimals for |value| >= 10000, otherwise two.
 */
[[nodiscard]] inline std::string number(double value) {
  if (value >= 10000.0 || value <= -10000.0) {
    return fmt::format("{:.0f}", value);
  }
  return fmt::format("{:.2f}", value);
}

} // namespace format
} // namespace helpers
} // namespace poolscope

#endif // POOLSCOPE_HELPERS_FORMAT_HPP
