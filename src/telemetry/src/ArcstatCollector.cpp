/**
 * @file ArcstatCollector.cpp
 * @brief arcstat command construction and codec wiring.
 */

#include "src/telemetry/inc/ArcstatCollector.hpp"

#include "src/telemetry/inc/FieldParser.hpp"
#include "src/telemetry/inc/PhaseClassifier.hpp"

#include <utility>

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

std::vector<std::string> buildArcstatCommand(const ArcstatConfig& config) {
  return {config.arcstatPath, "-p", "-f", arcstatFieldList(config.hasL2arc),
          fmt::format("{}", config.interval.count())};
}

SampleCodec<ArcSample> makeArcstatCodec(bool hasL2arc) {
  SampleCodec<ArcSample> codec;
  codec.parse = [hasL2arc](std::string_view line, std::vector<ParseWarning>& warnings) {
    return parseArcstatLine(line, hasL2arc, warnings);
  };
  codec.classify = [](const ArcSample& s) { return classifyPhase(s); };
  return codec;
}

std::unique_ptr<ArcstatCollector> makeArcstatCollector(const ArcstatConfig& config) {
  const std::vector<std::string> ARGV = buildArcstatCommand(config);

  LineSourceFactory factory = [ARGV]() -> std::unique_ptr<LineSource> {
    return std::make_unique<ProcessLineSource>(ARGV);
  };

  return std::make_unique<ArcstatCollector>(config.hasL2arc ? "arcstat+l2arc" : "arcstat",
                                            std::move(factory), makeArcstatCodec(config.hasL2arc),
                                            config.collector);
}

} // namespace telemetry

} // namespace poolscope
