/**
 * @file Collector.cpp
 * @brief Collector status names.
 */

#include "src/telemetry/inc/Collector.hpp"

namespace poolscope {

namespace telemetry {

const char* toString(CollectorState state) noexcept {
  switch (state) {
  case CollectorState::IDLE:
    return "idle";
  case CollectorState::WARMING:
    return "warming";
  case CollectorState::ACTIVE:
    return "active";
  case CollectorState::COOLING_DOWN:
    return "cooling down";
  case CollectorState::STOPPED:
    return "stopped";
  }
  return "unknown";
}

const char* toString(CollectorStatus status) noexcept {
  switch (status) {
  case CollectorStatus::OK:
    return "ok";
  case CollectorStatus::ALREADY_STARTED:
    return "already started";
  case CollectorStatus::SOURCE_UNAVAILABLE:
    return "source unavailable";
  }
  return "unknown";
}

} // namespace telemetry

} // namespace poolscope
