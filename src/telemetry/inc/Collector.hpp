#ifndef POOLSCOPE_TELEMETRY_COLLECTOR_HPP
#define POOLSCOPE_TELEMETRY_COLLECTOR_HPP
/**
 * @file Collector.hpp
 * @brief Background sampler that turns a LineSource into labelled samples.
 *
 * Lifecycle:
 *
 *   IDLE --start(n)--> WARMING(n) --n samples--> ACTIVE --stop(m)--> COOLING_DOWN(m)
 *        --m samples--> STOPPED
 *
 * start(0) goes straight to ACTIVE. Samples captured while WARMING carry
 * WARMUP_LABEL, while COOLING_DOWN carry COOLDOWN_LABEL, and while ACTIVE the
 * label last passed to segment(). Labels are assigned at capture time and
 * never rewritten.
 *
 * If the source ends unexpectedly the collector asks the factory for a fresh
 * source, up to CollectorConfig::maxRestarts times, keeping every sample
 * captured so far. When restarts are exhausted the result is marked
 * incomplete. Nothing here throws to the driver.
 *
 * @note Thread-safe: segment(), state() and the other observers may be called
 *       from any thread. start() and stop() are serialized against each other.
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/telemetry/inc/LineSource.hpp"
#include "src/telemetry/inc/Sample.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace poolscope {

namespace telemetry {

/* ----------------------------- Status Codes ----------------------------- */

/**
 * @brief Collector lifecycle state.
 */
enum class CollectorState : std::uint8_t {
  IDLE = 0,
  WARMING,
  ACTIVE,
  COOLING_DOWN,
  STOPPED,
};

/// @brief Human-readable state name.
[[nodiscard]] const char* toString(CollectorState state) noexcept;

/**
 * @brief Result of Collector::start().
 */
enum class CollectorStatus : std::uint8_t {
  OK = 0,
  ALREADY_STARTED,    ///< start() was already called on this collector
  SOURCE_UNAVAILABLE, ///< The telemetry tool could not be spawned
};

/// @brief Human-readable status name.
[[nodiscard]] const char* toString(CollectorStatus status) noexcept;

/* ----------------------------- Config ----------------------------- */

/**
 * @brief Collector tuning.
 */
struct CollectorConfig {
  std::size_t maxRestarts{2};                      ///< Fresh sources after unexpected end
  std::chrono::milliseconds readTimeout{100};      ///< Poll granularity for stop requests
  std::size_t maxParseWarnings{256};               ///< Warnings retained in the result

  /// @brief Preset that never restarts a dead source.
  [[nodiscard]] static CollectorConfig noRestart() noexcept {
    CollectorConfig cfg;
    cfg.maxRestarts = 0;
    return cfg;
  }
};

/**
 * @brief Line parser and classifier for one sample type.
 */
template <typename SampleT> struct SampleCodec {
  /// Returns nullopt for lines that carry no sample (headers, blanks).
  std::function<std::optional<SampleT>(std::string_view, std::vector<ParseWarning>&)> parse;
  /// Phase of a parsed, labelled sample.
  std::function<Phase(const SampleT&)> classify;
};

/* ----------------------------- Collector ----------------------------- */

/**
 * @brief Owns one background thread and one telemetry source.
 * @tparam SampleT PoolSample or ArcSample.
 */
template <typename SampleT> class Collector {
public:
  /**
   * @param name    Used in logs and as Telemetry::source.
   * @param factory Creates a fresh source for start() and each restart.
   * @param codec   Parses and classifies lines.
   * @param config  Restart and polling parameters.
   */
  Collector(std::string name, LineSourceFactory factory, SampleCodec<SampleT> codec,
            CollectorConfig config = {})
      : name_(std::move(name)), factory_(std::move(factory)), codec_(std::move(codec)),
        config_(config) {
    result_.source = name_;
  }

  /// Stops (no cooldown), reaps the source and joins the thread.
  ~Collector() { shutdown(); }

  Collector(const Collector&) = delete;
  Collector& operator=(const Collector&) = delete;

  /**
   * @brief Spawn the source and begin sampling.
   * @param warmupCount Samples to capture under WARMUP_LABEL first.
   * @return OK, ALREADY_STARTED, or SOURCE_UNAVAILABLE (the collector is then
   *         STOPPED and stop() returns an incomplete, empty result).
   * @note Returns once the source is running; use awaitWarmup() to block.
   */
  [[nodiscard]] CollectorStatus start(std::size_t warmupCount) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (state_ != CollectorState::IDLE) {
        return CollectorStatus::ALREADY_STARTED;
      }
    }

    std::unique_ptr<LineSource> src = factory_ ? factory_() : nullptr;
    const SourceStatus OPENED = src ? src->open() : SourceStatus::INVALID_ARGUMENT;

    std::lock_guard<std::mutex> lock(mtx_);
    result_.startNs = helpers::clock::realtimeNs();
    result_.warmupTarget = warmupCount;

    if (OPENED != SourceStatus::OK) {
      helpers::log::error("{}: telemetry source unavailable ({})", name_, toString(OPENED));
      result_.sourceUnavailable = true;
      result_.complete = false;
      result_.endNs = result_.startNs;
      state_ = CollectorState::STOPPED;
      loopDone_ = true;
      finalized_ = true;
      return CollectorStatus::SOURCE_UNAVAILABLE;
    }

    helpers::log::info("{}: started '{}' (warmup {} samples)", name_, src->describe(),
                       warmupCount);
    source_ = std::move(src);
    warmupTarget_ = warmupCount;
    state_ = (warmupCount > 0) ? CollectorState::WARMING : CollectorState::ACTIVE;
    thread_ = std::thread(&Collector::run, this);
    return CollectorStatus::OK;
  }

  /**
   * @brief Block until warmup is captured or sampling has ended.
   * @return true if the warmup target was reached.
   */
  bool awaitWarmup() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return state_ != CollectorState::WARMING || loopDone_; });
    return state_ != CollectorState::IDLE && !result_.sourceUnavailable &&
           warmupCaptured_ >= warmupTarget_;
  }

  /**
   * @brief Set the driver label for subsequent samples.
   *
   * Always recorded; only takes effect on samples captured while ACTIVE.
   */
  void segment(std::string label) {
    std::lock_guard<std::mutex> lock(mtx_);
    helpers::log::debug("{}: segment '{}' -> '{}'", name_, driverLabel_, label);
    driverLabel_ = std::move(label);
  }

  /**
   * @brief Capture @p cooldownCount more samples, then stop and return everything.
   *
   * Idempotent: later calls return the finalized telemetry unchanged.
   * Returns early if the source ends for good while cooling down.
   */
  [[nodiscard]] Telemetry<SampleT> stop(std::size_t cooldownCount) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMtx_);
    std::unique_lock<std::mutex> lock(mtx_);
    if (finalized_) {
      return result_;
    }

    if (state_ == CollectorState::IDLE) {
      result_.startNs = helpers::clock::realtimeNs();
      result_.endNs = result_.startNs;
      result_.complete = false;
      state_ = CollectorState::STOPPED;
      finalized_ = true;
      return result_;
    }

    state_ = CollectorState::COOLING_DOWN;
    cooldownTarget_ = cooldownCount;
    result_.cooldownTarget = cooldownCount;
    cv_.wait(lock, [this] { return cooldownCaptured_ >= cooldownTarget_ || loopDone_; });

    stopRequested_ = true;
    lock.unlock();
    cv_.notify_all();

    if (thread_.joinable()) {
      thread_.join();
    }

    lock.lock();
    result_.endNs = helpers::clock::realtimeNs();
    result_.complete = !sourceFailed_;
    state_ = CollectorState::STOPPED;
    finalized_ = true;
    helpers::log::info("{}: stopped with {} samples ({} restarts{})", name_,
                       result_.samples.size(), result_.restarts,
                       result_.complete ? "" : ", incomplete");
    return result_;
  }

  /// @brief Current lifecycle state.
  [[nodiscard]] CollectorState state() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return state_;
  }

  /// @brief Samples captured so far.
  [[nodiscard]] std::size_t sampleCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return result_.samples.size();
  }

  /// @brief Label last passed to segment().
  [[nodiscard]] std::string currentLabel() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return driverLabel_;
  }

  /// @brief Collector name.
  [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
  void shutdown() noexcept {
    try {
      (void)stop(0);
    } catch (const std::exception& e) {
      helpers::log::error("{}: shutdown failed: {}", name_, e.what());
    }
  }

  /// Label for a sample captured now. Caller holds mtx_.
  [[nodiscard]] std::string effectiveLabelLocked() const {
    switch (state_) {
    case CollectorState::WARMING:
      return std::string(WARMUP_LABEL);
    case CollectorState::COOLING_DOWN:
      return std::string(COOLDOWN_LABEL);
    default:
      return driverLabel_;
    }
  }

  void capture(const std::string& line) {
    std::vector<ParseWarning> warnings;
    std::optional<SampleT> parsed = codec_.parse ? codec_.parse(line, warnings) : std::nullopt;
    for (const ParseWarning& w : warnings) {
      helpers::log::debug("{}: {}", name_, w.toString());
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (!warnings.empty()) {
      if (result_.parseWarningCount == 0) {
        helpers::log::warn("{}: unparsable fields zeroed ({})", name_, warnings.front().toString());
      }
      result_.parseWarningCount += warnings.size();
      for (ParseWarning& w : warnings) {
        if (result_.parseWarnings.size() >= config_.maxParseWarnings) {
          break;
        }
        result_.parseWarnings.push_back(std::move(w));
      }
    }

    if (!parsed || state_ == CollectorState::STOPPED || state_ == CollectorState::IDLE) {
      return;
    }

    SampleT s = std::move(*parsed);
    s.segmentLabel = effectiveLabelLocked();

    s.timestampNs = stampClock_.next();
    s.phase = codec_.classify ? codec_.classify(s) : Phase::IDLE;
    result_.samples.push_back(std::move(s));

    if (state_ == CollectorState::WARMING) {
      ++warmupCaptured_;
      if (warmupCaptured_ >= warmupTarget_) {
        state_ = CollectorState::ACTIVE;
        helpers::log::debug("{}: warmup complete", name_);
      }
    } else if (state_ == CollectorState::COOLING_DOWN) {
      ++cooldownCaptured_;
    }
    cv_.notify_all();
  }

  [[nodiscard]] bool stopRequested() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stopRequested_;
  }

  /// Replace the dead source. Returns false when restarts are exhausted.
  bool restartSource() {
    source_->close();
    while (true) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopRequested_ || result_.restarts >= config_.maxRestarts) {
          return false;
        }
        ++result_.restarts;
        helpers::log::warn("{}: source ended, restarting ({}/{})", name_, result_.restarts,
                           config_.maxRestarts);
      }
      std::unique_ptr<LineSource> next = factory_();
      if (!next) {
        continue;
      }
      const SourceStatus OPENED = next->open();
      if (OPENED == SourceStatus::OK) {
        source_ = std::move(next);
        return true;
      }
      helpers::log::warn("{}: restart failed ({})", name_, toString(OPENED));
    }
  }

  void run() {
    std::string line;
    try {
      while (!stopRequested()) {
        const ReadStatus ST = source_->readLine(line, config_.readTimeout);
        if (ST == ReadStatus::LINE) {
          capture(line);
        } else if (ST == ReadStatus::END) {
          if (stopRequested()) {
            break;
          }
          if (!restartSource()) {
            if (!stopRequested()) {
              helpers::log::error("{}: source lost, telemetry incomplete", name_);
              std::lock_guard<std::mutex> lock(mtx_);
              sourceFailed_ = true;
            }
            break;
          }
        }
      }
    } catch (const std::exception& e) {
      helpers::log::error("{}: sampling loop failed: {}", name_, e.what());
      std::lock_guard<std::mutex> lock(mtx_);
      sourceFailed_ = true;
    }

    source_->close();
    {
      std::lock_guard<std::mutex> lock(mtx_);
      loopDone_ = true;
    }
    cv_.notify_all();
  }

  std::string name_;
  LineSourceFactory factory_;
  SampleCodec<SampleT> codec_;
  CollectorConfig config_;

  std::mutex lifecycleMtx_; ///< Serializes start() / stop()

  mutable std::mutex mtx_; ///< Guards everything below
  std::condition_variable cv_;
  CollectorState state_{CollectorState::IDLE};
  std::string driverLabel_;
  std::size_t warmupTarget_{0};
  std::size_t warmupCaptured_{0};
  std::size_t cooldownTarget_{0};
  std::size_t cooldownCaptured_{0};
  helpers::clock::StrictClock stampClock_;
  bool stopRequested_{false};
  bool loopDone_{false};
  bool sourceFailed_{false};
  bool finalized_{false};
  Telemetry<SampleT> result_;

  std::unique_ptr<LineSource> source_; ///< Touched by the loop thread only after start()
  std::thread thread_;
};

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_COLLECTOR_HPP
