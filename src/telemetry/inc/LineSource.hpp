#ifndef POOLSCOPE_TELEMETRY_LINE_SOURCE_HPP
#define POOLSCOPE_TELEMETRY_LINE_SOURCE_HPP
/**
 * @file LineSource.hpp
 * @brief Line-oriented input abstraction and its child-process implementation.
 *
 * Collectors pull lines from a LineSource. The production source spawns the
 * telemetry tool (zpool, arcstat) with its stdout on a pipe; tests substitute
 * scripted sources through a LineSourceFactory.
 *
 * @note Thread-safe: No. One reader thread per source.
 */

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Status Codes ----------------------------- */

/**
 * @brief Result of opening a source.
 */
enum class SourceStatus : std::uint8_t {
  OK = 0,
  INVALID_ARGUMENT, ///< Empty command
  SPAWN_FAILED,     ///< pipe/fork/exec failure
  NOT_FOUND,        ///< Executable not found
};

/// @brief Human-readable status name.
[[nodiscard]] const char* toString(SourceStatus status) noexcept;

/**
 * @brief Result of one read attempt.
 */
enum class ReadStatus : std::uint8_t {
  LINE = 0, ///< A complete line was produced
  TIMEOUT,  ///< No complete line within the timeout
  END,      ///< Source exhausted or failed; no further lines
};

/// @brief Human-readable status name.
[[nodiscard]] const char* toString(ReadStatus status) noexcept;

/* ----------------------------- LineSource ----------------------------- */

/**
 * @brief Producer of text lines.
 */
class LineSource {
public:
  virtual ~LineSource() = default;

  /// @brief Acquire the underlying resource.
  [[nodiscard]] virtual SourceStatus open() noexcept = 0;

  /**
   * @brief Wait up to @p timeout for the next line.
   * @param line Receives the line without its terminator when LINE is returned.
   */
  [[nodiscard]] virtual ReadStatus readLine(std::string& line,
                                            std::chrono::milliseconds timeout) = 0;

  /// @brief Release the resource. Safe to call repeatedly.
  virtual void close() noexcept = 0;

  /// @brief Short description for logs.
  [[nodiscard]] virtual std::string describe() const = 0;
};

/// Produces a fresh, unopened source (used again on every restart).
using LineSourceFactory = std::function<std::unique_ptr<LineSource>()>;

/* ----------------------------- ProcessLineSource ----------------------------- */

/**
 * @brief Reads the stdout of a child process.
 *
 * The child's stderr goes to /dev/null. close() sends SIGTERM, waits up to
 * TERM_GRACE for exit, then SIGKILLs; the child is always reaped.
 */
class ProcessLineSource final : public LineSource {
public:
  /// Time allowed between SIGTERM and SIGKILL.
  static constexpr std::chrono::milliseconds TERM_GRACE{2000};

  /// Longest partial line kept; longer lines are dropped up to their newline.
  static constexpr std::size_t MAX_LINE_BYTES = 64 * 1024;

  /**
   * @param argv                Program and arguments (argv[0] looked up on PATH).
   * @param discardLeadingLines Lines dropped after open (e.g. the since-boot report).
   */
  explicit ProcessLineSource(std::vector<std::string> argv, std::size_t discardLeadingLines = 0);
  ~ProcessLineSource() override;

  ProcessLineSource(const ProcessLineSource&) = delete;
  ProcessLineSource& operator=(const ProcessLineSource&) = delete;

  [[nodiscard]] SourceStatus open() noexcept override;
  [[nodiscard]] ReadStatus readLine(std::string& line, std::chrono::milliseconds timeout) override;
  void close() noexcept override;
  [[nodiscard]] std::string describe() const override;

  /// @brief Child pid while running, -1 otherwise.
  [[nodiscard]] pid_t pid() const noexcept { return pid_; }

  /// @brief Raw wait status of the last reaped child (valid after close()).
  [[nodiscard]] int exitStatus() const noexcept { return exitStatus_; }

private:
  /// Pop one complete line from buffer_ into @p line.
  bool takeLine(std::string& line);
  void reap() noexcept;

  std::vector<std::string> argv_;
  std::size_t discardLeading_{0};
  std::size_t discarded_{0};
  pid_t pid_{-1};
  int fd_{-1};
  int exitStatus_{0};
  bool eof_{false};
  bool overlong_{false}; ///< Discarding the rest of an oversized line
  std::string buffer_;
};

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_LINE_SOURCE_HPP
