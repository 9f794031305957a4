/**
 * @file IostatCollector.cpp
 * @brief zpool iostat command construction and codec wiring.
 */

#include "src/telemetry/inc/IostatCollector.hpp"

#include "src/telemetry/inc/FieldParser.hpp"

#include <utility>

#include <fmt/core.h>

namespace poolscope {

namespace telemetry {

std::vector<std::string> buildIostatCommand(const IostatConfig& config) {
  std::vector<std::string> argv{config.zpoolPath, "iostat", "-H"};
  if (config.extendedLatency) {
    argv.emplace_back("-l");
  }
  argv.push_back(config.pool);
  argv.push_back(fmt::format("{}", config.interval.count()));
  return argv;
}

SampleCodec<PoolSample> makeIostatCodec(const ClassifierConfig& classifier) {
  SampleCodec<PoolSample> codec;
  codec.parse = [](std::string_view line, std::vector<ParseWarning>& warnings) {
    return parseIostatLine(line, warnings);
  };
  codec.classify = [classifier](const PoolSample& s) { return classifyPhase(s, classifier); };
  return codec;
}

std::unique_ptr<IostatCollector> makeIostatCollector(const IostatConfig& config) {
  const std::vector<std::string> ARGV = buildIostatCommand(config);
  const std::size_t SKIP = config.skipFirstReport ? 1 : 0;

  LineSourceFactory factory = [ARGV, SKIP]() -> std::unique_ptr<LineSource> {
    return std::make_unique<ProcessLineSource>(ARGV, SKIP);
  };

  return std::make_unique<IostatCollector>(fmt::format("iostat({})", config.pool),
                                           std::move(factory), makeIostatCodec(config.classifier),
                                           config.collector);
}

} // namespace telemetry

} // namespace poolscope
