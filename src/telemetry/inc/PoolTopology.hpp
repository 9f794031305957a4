#ifndef POOLSCOPE_TELEMETRY_POOL_TOPOLOGY_HPP
#define POOLSCOPE_TELEMETRY_POOL_TOPOLOGY_HPP
/**
 * @file PoolTopology.hpp
 * @brief L2ARC (cache vdev) detection from `zpool status`.
 *
 * Called once by the driver before constructing an ARC collector; the result
 * is passed in as ArcstatConfig::hasL2arc.
 */

#include <chrono>
#include <string>
#include <string_view>

namespace poolscope {

namespace telemetry {

/// Upper bound on the time detectL2arc() waits for `zpool status`.
inline constexpr std::chrono::seconds TOPOLOGY_TIMEOUT{10};

/**
 * @brief True if @p zpoolStatus lists a cache vdev.
 * @param zpoolStatus Full `zpool status <pool>` output.
 * @return true when a line reading exactly "cache" follows the
 *         "NAME ... STATE" header of the config section.
 */
[[nodiscard]] bool hasCacheVdev(std::string_view zpoolStatus) noexcept;

/**
 * @brief Run `zpool status <pool>` and look for a cache vdev.
 * @param pool      Pool name.
 * @param zpoolPath Executable.
 * @return false on any failure (missing tool, unknown pool, timeout).
 */
[[nodiscard]] bool detectL2arc(const std::string& pool, const std::string& zpoolPath = "zpool");

} // namespace telemetry

} // namespace poolscope

#endif // POOLSCOPE_TELEMETRY_POOL_TOPOLOGY_HPP
