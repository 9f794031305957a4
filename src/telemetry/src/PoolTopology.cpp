/**
 * @file PoolTopology.cpp
 * @brief Implementation of cache vdev detection.
 */

#include "src/telemetry/inc/PoolTopology.hpp"

#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/telemetry/inc/LineSource.hpp"

#include <sys/wait.h>

#include <exception>
#include <vector>

namespace poolscope {

namespace telemetry {

using helpers::strings::startsWith;
using helpers::strings::trim;

bool hasCacheVdev(std::string_view zpoolStatus) noexcept {
  bool inConfig = false;
  std::size_t pos = 0;
  while (pos <= zpoolStatus.size()) {
    std::size_t end = zpoolStatus.find('\n', pos);
    if (end == std::string_view::npos) {
      end = zpoolStatus.size();
    }
    const std::string_view LINE = trim(zpoolStatus.substr(pos, end - pos));
    pos = end + 1;

    if (startsWith(LINE, "NAME") && LINE.find("STATE") != std::string_view::npos) {
      inConfig = true;
      continue;
    }
    if (inConfig && LINE == "cache") {
      return true;
    }
  }
  return false;
}

bool detectL2arc(const std::string& pool, const std::string& zpoolPath) {
  try {
    ProcessLineSource src({zpoolPath, "status", pool});
    const SourceStatus OPENED = src.open();
    if (OPENED != SourceStatus::OK) {
      helpers::log::warn("L2ARC detection for '{}' failed: {}", pool, toString(OPENED));
      return false;
    }

    const auto DEADLINE = std::chrono::steady_clock::now() + TOPOLOGY_TIMEOUT;
    std::string text;
    std::string line;
    while (true) {
      const auto LEFT = std::chrono::duration_cast<std::chrono::milliseconds>(
          DEADLINE - std::chrono::steady_clock::now());
      if (LEFT.count() <= 0) {
        helpers::log::warn("L2ARC detection for '{}' timed out", pool);
        return false;
      }
      const ReadStatus ST = src.readLine(line, LEFT);
      if (ST == ReadStatus::END) {
        break;
      }
      if (ST == ReadStatus::LINE) {
        text += line;
        text.push_back('\n');
      }
    }

    src.close();
    const int STATUS = src.exitStatus();
    if (!WIFEXITED(STATUS) || WEXITSTATUS(STATUS) != 0) {
      helpers::log::warn("L2ARC detection for '{}': zpool status failed", pool);
      return false;
    }
    return hasCacheVdev(text);
  } catch (const std::exception& e) {
    helpers::log::warn("L2ARC detection for '{}' failed: {}", pool, e.what());
    return false;
  }
}

} // namespace telemetry

} // namespace poolscope
