/**
 * @file pool-telemetry.cpp
 * @brief Sample ZFS pool (and optionally ARC) telemetry and print statistics.
 *
 * Runs `zpool iostat` (and `arcstat` with --arc) for a fixed duration while an
 * external workload runs, then prints per-segment statistics, phase breakdown,
 * request sizes and anomalies.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/telemetry/inc/Analytics.hpp"
#include "src/telemetry/inc/ArcstatCollector.hpp"
#include "src/telemetry/inc/IostatCollector.hpp"
#include "src/telemetry/inc/PoolTopology.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <fmt/core.h>

namespace args = poolscope::helpers::args;
namespace logging = poolscope::helpers::log;
namespace telemetry = poolscope::telemetry;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_POOL = 1,
  ARG_INTERVAL = 2,
  ARG_DURATION = 3,
  ARG_WARMUP = 4,
  ARG_COOLDOWN = 5,
  ARG_ARC = 6,
  ARG_SEGMENT = 7,
  ARG_VERBOSE = 8,
  ARG_ZPOOL = 9,
  ARG_ARCSTAT = 10,
};

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Sample zpool iostat (and arcstat) while a workload runs, then print statistics.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_POOL] = {"--pool", 1, true, "Pool to sample", "NAME"};
  map[ARG_INTERVAL] = {"--interval", 1, false, "Report interval (default: 1)", "SECONDS"};
  map[ARG_DURATION] = {"--duration", 1, false, "Sampling time after warmup (default: 30)",
                       "SECONDS"};
  map[ARG_WARMUP] = {"--warmup", 1, false, "Warmup samples (default: 3)", "COUNT"};
  map[ARG_COOLDOWN] = {"--cooldown", 1, false, "Cooldown samples (default: 3)", "COUNT"};
  map[ARG_ARC] = {"--arc", 0, false, "Also sample ARC statistics via arcstat"};
  map[ARG_SEGMENT] = {"--segment", 1, false, "Label for the sampling window (default: run)",
                      "LABEL"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Enable debug logging"};
  map[ARG_ZPOOL] = {"--zpool", 1, false, "zpool executable (default: zpool)", "PATH"};
  map[ARG_ARCSTAT] = {"--arcstat", 1, false, "arcstat executable (default: arcstat)", "PATH"};
  return map;
}

struct Options {
  std::string pool;
  std::uint32_t intervalSec{1};
  std::uint32_t durationSec{30};
  std::uint32_t warmup{3};
  std::uint32_t cooldown{3};
  bool arc{false};
  std::string segment{"run"};
  bool verbose{false};
  std::string zpoolPath{"zpool"};
  std::string arcstatPath{"arcstat"};
};

/// Read an integer flag into @p out; false (with message) on bad input.
bool readUint(const args::ParsedArgs& pargs, ArgKey key, std::string_view flag,
              std::uint32_t& out) {
  const std::optional<std::string_view> TEXT = args::value(pargs, key);
  if (!TEXT) {
    return true;
  }
  const std::optional<std::uint32_t> V = args::parseUint(*TEXT);
  if (!V) {
    fmt::print(stderr, "Error: {} expects a non-negative integer, got '{}'\n", flag, *TEXT);
    return false;
  }
  out = *V;
  return true;
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  Options opt;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  if (std::find(argList.begin(), argList.end(), "--help") != argList.end()) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  opt.pool = std::string(*args::value(pargs, ARG_POOL));
  if (!readUint(pargs, ARG_INTERVAL, "--interval", opt.intervalSec) ||
      !readUint(pargs, ARG_DURATION, "--duration", opt.durationSec) ||
      !readUint(pargs, ARG_WARMUP, "--warmup", opt.warmup) ||
      !readUint(pargs, ARG_COOLDOWN, "--cooldown", opt.cooldown)) {
    return 1;
  }
  if (opt.intervalSec == 0) {
    fmt::print(stderr, "Error: --interval must be at least 1\n");
    return 1;
  }
  opt.arc = args::has(pargs, ARG_ARC);
  opt.verbose = args::has(pargs, ARG_VERBOSE);
  opt.segment = std::string(args::value(pargs, ARG_SEGMENT).value_or(opt.segment));
  opt.zpoolPath = std::string(args::value(pargs, ARG_ZPOOL).value_or(opt.zpoolPath));
  opt.arcstatPath = std::string(args::value(pargs, ARG_ARCSTAT).value_or(opt.arcstatPath));

  logging::setLevel(opt.verbose ? logging::Level::DEBUG : logging::Level::WARN);

  // Pool collector: mandatory
  telemetry::IostatConfig iostatCfg = telemetry::IostatConfig::forPool(opt.pool);
  iostatCfg.interval = std::chrono::seconds{opt.intervalSec};
  iostatCfg.zpoolPath = opt.zpoolPath;
  std::unique_ptr<telemetry::IostatCollector> iostat = telemetry::makeIostatCollector(iostatCfg);

  const telemetry::CollectorStatus POOL_STATUS = iostat->start(opt.warmup);
  if (POOL_STATUS != telemetry::CollectorStatus::OK) {
    fmt::print(stderr, "Error: cannot sample pool '{}': {}\n", opt.pool,
               telemetry::toString(POOL_STATUS));
    return 1;
  }

  // ARC collector: optional, degraded on failure
  std::unique_ptr<telemetry::ArcstatCollector> arcstat;
  if (opt.arc) {
    telemetry::ArcstatConfig arcCfg;
    arcCfg.interval = std::chrono::seconds{opt.intervalSec};
    arcCfg.hasL2arc = telemetry::detectL2arc(opt.pool, opt.zpoolPath);
    arcCfg.arcstatPath = opt.arcstatPath;
    arcstat = telemetry::makeArcstatCollector(arcCfg);
    const telemetry::CollectorStatus ARC_STATUS = arcstat->start(opt.warmup);
    if (ARC_STATUS != telemetry::CollectorStatus::OK) {
      fmt::print(stderr, "Warning: ARC statistics unavailable: {}\n",
                 telemetry::toString(ARC_STATUS));
    }
  }

  fmt::print("Sampling pool '{}' every {}s: {} warmup, {}s '{}', {} cooldown\n", opt.pool,
             opt.intervalSec, opt.warmup, opt.durationSec, opt.segment, opt.cooldown);

  if (!iostat->awaitWarmup()) {
    fmt::print(stderr, "Warning: pool telemetry ended during warmup\n");
  }
  if (arcstat) {
    (void)arcstat->awaitWarmup();
  }

  iostat->segment(opt.segment);
  if (arcstat) {
    arcstat->segment(opt.segment);
  }

  std::this_thread::sleep_for(std::chrono::seconds{opt.durationSec});

  const telemetry::PoolTelemetry POOL = iostat->stop(opt.cooldown);
  std::optional<telemetry::ArcTelemetry> arc;
  if (arcstat) {
    arc = arcstat->stop(opt.cooldown);
  }

  const telemetry::RunAnalysis ANALYSIS =
      telemetry::analyzeRun(POOL, arc && !arc->sourceUnavailable ? &*arc : nullptr, {});

  fmt::print("\n{} .. {}\n", poolscope::helpers::format::isoTimestamp(POOL.startNs),
             poolscope::helpers::format::isoTimestamp(POOL.endNs));
  fmt::print("{}", ANALYSIS.toString());

  for (const telemetry::MetricStats& m : ANALYSIS.pool.steadyState) {
    if (m.metric == "total_bandwidth_mbps" && !m.stats.empty()) {
      fmt::print("\nsteady-state throughput: {} mean, {} p99\n",
                 poolscope::helpers::format::megabytesPerSec(m.stats.mean),
                 poolscope::helpers::format::megabytesPerSec(m.stats.p99));
    }
  }

  return POOL.complete ? 0 : 1;
}
