#ifndef POOLSCOPE_TELEMETRY_ARCSTAT_COLLECTOR_HPP
#define POOLSCOPE_TELEMETRY_ARCSTAT_COLLECTOR_HPP
/**
 * @file ArcstatCollector.hpp
 * @brief ARC / L2ARC collector over `arcstat`.
 *
 * The field set is fixed per collector by ArcstatConfig::hasL2arc. arcstat
 * rejects L2ARC fields on systems without a cache device, so the driver must
 * detect L2ARC first (see PoolTopology.hpp).
 */

#include "src/telemetry/inc/Collector.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace poolscope {

namespace telemetry {

/**
 * @brief Configuration for an ARC collector.
 */
struct ArcstatConfig {
  std::chrono::seconds interval{1};     ///< Report interval passed to arcstat
  bool hasL2arc{false};                 ///< Request and emit L2ARC fields
  std::string arcstatPath{"arcstat"};   ///< Executable (PATH lookup)
  CollectorConfig collector{};
};

using ArcstatCollector = Collector<ArcSample>;

/**
 * @brief argv for the configured command.
 * @return e.g. {"arcstat", "-p", "-f", "hit%,miss%,...", "1"}.
 */
[[nodiscard]] std::vector<std::string> buildArcstatCommand(const ArcstatConfig& config);

/// @brief Parser (fixed field set) and label classifier for arcstat lines.
[[nodiscard]] SampleCodec<ArcSample> makeArcstatCodec(bool hasL2arc);

/**
 * @brief Collector spawning `arcstat`.
 * @return Collector named "arcstat" or "arcstat+l2arc", not yet started.
 */
[[nodiscard]] std::unique_ptr<ArcstatCollector> makeArcstatCollector(const ArcstatConfig& config);

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_ARCSTAT_COLLECTOR_HPP
