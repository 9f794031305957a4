#ifndef POOLSCOPE_TELEMETRY_IOSTAT_COLLECTOR_HPP
#define POOLSCOPE_TELEMETRY_IOSTAT_COLLECTOR_HPP
/**
 * @file IostatCollector.hpp
 * @brief Pool I/O collector over `zpool iostat`.
 */

#include "src/telemetry/inc/Collector.hpp"
#include "src/telemetry/inc/PhaseClassifier.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace poolscope {

namespace telemetry {

/**
 * @brief Configuration for a pool iostat collector.
 */
struct IostatConfig {
  std::string pool;                    ///< Pool name (required)
  std::chrono::seconds interval{1};    ///< Report interval passed to zpool
  bool extendedLatency{true};          ///< Request -l latency columns
  bool skipFirstReport{true};          ///< Drop the since-boot average line
  std::string zpoolPath{"zpool"};      ///< Executable (PATH lookup)
  ClassifierConfig classifier{};
  CollectorConfig collector{};

  /// @brief Defaults for @p poolName.
  [[nodiscard]] static IostatConfig forPool(std::string poolName) {
    IostatConfig cfg;
    cfg.pool = std::move(poolName);
    return cfg;
  }
};

using IostatCollector = Collector<PoolSample>;

/**
 * @brief argv for the configured command.
 * @return e.g. {"zpool", "iostat", "-H", "-l", "tank", "1"}.
 */
[[nodiscard]] std::vector<std::string> buildIostatCommand(const IostatConfig& config);

/// @brief Parser and bandwidth classifier for iostat lines.
[[nodiscard]] SampleCodec<PoolSample> makeIostatCodec(const ClassifierConfig& classifier = {});

/**
 * @brief Collector spawning `zpool iostat` for the configured pool.
 * @return Collector named "iostat(<pool>)", not yet started.
 */
[[nodiscard]] std::unique_ptr<IostatCollector> makeIostatCollector(const IostatConfig& config);

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_IOSTAT_COLLECTOR_HPP
