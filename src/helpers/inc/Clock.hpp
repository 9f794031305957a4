#ifndef POOLSCOPE_HELPERS_CLOCK_HPP
#define POOLSCOPE_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Wall-clock timestamps for telemetry samples.
 *
 * Samples are stamped with CLOCK_REALTIME so they can be lined up with
 * benchmark logs from other processes.
 */

#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_REALTIME

namespace poolscope {
namespace helpers {
namespace clock {

/* ----------------------------- API ----------------------------- */

/// @brief Nanoseconds since the Unix epoch.
[[nodiscard]] inline std::uint64_t realtimeNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * 1'000'000'000ULL +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/**
 * @brief Realtime stamps that never repeat or go backwards.
 *
 * A step of the system clock, or two reads within its resolution, yields
 * the previous stamp plus one nanosecond.
 *
 * @note Thread-safe: No. Callers serialize next().
 */
class StrictClock {
public:
  /// @brief Stamp strictly greater than every earlier one.
  [[nodiscard]] std::uint64_t next() noexcept {
    std::uint64_t now = realtimeNs();
    if (now <= last_) {
      now = last_ + 1;
    }
    last_ = now;
    return now;
  }

  /// @brief Last stamp handed out (0 before the first).
  [[nodiscard]] std::uint64_t last() const noexcept { return last_; }

private:
  std::uint64_t last_{0};
};

} // namespace clock
} // namespace helpers
} // namespace poolscope

#endif // POOLSCOPE_HELPERS_CLOCK_HPP
