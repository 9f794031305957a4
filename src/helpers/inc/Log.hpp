#ifndef POOLSCOPE_HELPERS_LOG_HPP
#define POOLSCOPE_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Leveled diagnostic logging on top of fmt.
 *
 * Messages below the active level are dropped before formatting. The default
 * sink writes one line per message to stderr:
 *
 *   [poolscope] WARN  iostat(tank): restarting source (1/2)
 *
 * A custom sink can be installed (tests capture messages this way).
 *
 * @note Thread-safe: Level is atomic; sink invocation is serialized.
 * @note Cold-path: Formats into std::string.
 */

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace poolscope {
namespace helpers {
namespace log {

/* ----------------------------- Level ----------------------------- */

/**
 * @brief Message severity, ordered from most to least verbose.
 */
enum class Level : std::uint8_t {
  DEBUG = 0,
  INFO,
  WARN,
  ERROR,
  OFF,
};

/// @brief Fixed-width level name.
[[nodiscard]] inline const char* toString(Level level) noexcept {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  case Level::OFF:
    return "OFF";
  }
  return "UNKNOWN";
}

/// Message consumer. Receives the already-formatted text without newline.
using Sink = std::function<void(Level, std::string_view)>;

namespace detail {

inline void stderrSink(Level level, std::string_view msg) {
  fmt::print(stderr, "[poolscope] {:<5} {}\n", toString(level), msg);
}

struct LogState {
  std::atomic<Level> level{Level::WARN};
  std::mutex sinkMtx;
  Sink sink{stderrSink};
};

inline LogState& state() noexcept {
  static LogState s;
  return s;
}

inline void emit(Level level, std::string_view msg) noexcept {
  LogState& s = state();
  std::lock_guard<std::mutex> lock(s.sinkMtx);
  if (!s.sink) {
    return;
  }
  try {
    s.sink(level, msg);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "[poolscope] log sink failed: %s\n", e.what());
  }
}

} // namespace detail

/* ----------------------------- Configuration ----------------------------- */

/// @brief Set the minimum level that will be emitted.
inline void setLevel(Level level) noexcept {
  detail::state().level.store(level, std::memory_order_relaxed);
}

/// @brief Current minimum level.
[[nodiscard]] inline Level level() noexcept {
  return detail::state().level.load(std::memory_order_relaxed);
}

/// @brief True if a message at @p lvl would be emitted.
[[nodiscard]] inline bool enabled(Level lvl) noexcept {
  const Level CUR = level();
  return CUR != Level::OFF && lvl >= CUR;
}

/// @brief Replace the sink. An empty sink silences all output.
inline void setSink(Sink sink) {
  detail::LogState& s = detail::state();
  std::lock_guard<std::mutex> lock(s.sinkMtx);
  s.sink = std::move(sink);
}

/// @brief Restore the default stderr sink.
inline void resetSink() { setSink(detail::stderrSink); }

/* ----------------------------- Emitters ----------------------------- */

template <typename... Args>
inline void write(Level lvl, fmt::format_string<Args...> fmtStr, Args&&... args) {
  if (!enabled(lvl)) {
    return;
  }
  detail::emit(lvl, fmt::format(fmtStr, std::forward<Args>(args)...));
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmtStr, Args&&... args) {
  write(Level::DEBUG, fmtStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void info(fmt::format_string<Args...> fmtStr, Args&&... args) {
  write(Level::INFO, fmtStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warn(fmt::format_string<Args...> fmtStr, Args&&... args) {
  write(Level::WARN, fmtStr, std::forward<Args>(args)...);
}

template <typename... Args>
inline void error(fmt::format_string<Args...> fmtStr, Args&&... args) {
  write(Level::ERROR, fmtStr, std::forward<Args>(args)...);
}

} // namespace log
} // namespace helpers
} // namespace poolscope

#endif // POOLSCOPE_HELPERS_LOG_HPP
