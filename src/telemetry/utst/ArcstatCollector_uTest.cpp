/**
 * @file ArcstatCollector_uTest.cpp
 * @brief Unit tests for arcstat command construction and codec.
 */

#include "src/telemetry/inc/ArcstatCollector.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

using poolscope::telemetry::ArcSample;
using poolscope::telemetry::ArcstatConfig;
using poolscope::telemetry::buildArcstatCommand;
using poolscope::telemetry::makeArcstatCodec;
using poolscope::telemetry::makeArcstatCollector;
using poolscope::telemetry::ParseWarning;
using poolscope::telemetry::Phase;
using poolscope::telemetry::SampleCodec;

/** @test Field list omits L2ARC columns without a cache device. */
TEST(ArcstatCollectorTest, CommandWithoutL2arc) {
  ArcstatConfig cfg;
  const std::vector<std::string> EXPECTED{
      "arcstat", "-p", "-f", "hit%,miss%,arcsz,read,hits,miss,dh%,ph%,mrusz%,mfusz%,zhits,zmisses",
      "1"};
  EXPECT_EQ(buildArcstatCommand(cfg), EXPECTED);
}

/** @test Field list includes L2ARC columns when present. */
TEST(ArcstatCollectorTest, CommandWithL2arc) {
  ArcstatConfig cfg;
  cfg.hasL2arc = true;
  cfg.interval = std::chrono::seconds(5);
  const std::vector<std::string> ARGV = buildArcstatCommand(cfg);
  ASSERT_EQ(ARGV.size(), 5U);
  EXPECT_EQ(ARGV[3],
            "hit%,miss%,arcsz,read,hits,miss,dh%,ph%,mrusz%,mfusz%,l2hit%,l2size,l2bytes,zhits,"
            "zmisses");
  EXPECT_EQ(ARGV[4], "5");
}

/** @test Codec phase comes from the segment label. */
TEST(ArcstatCollectorTest, CodecClassifiesByLabel) {
  const SampleCodec<ArcSample> CODEC = makeArcstatCodec(false);
  std::vector<ParseWarning> warnings;
  std::optional<ArcSample> s = CODEC.parse("95 5 16G 2000 1900 100 90 30 55 45 300 100", warnings);
  ASSERT_TRUE(s.has_value());
  EXPECT_DOUBLE_EQ(s->arcSizeGiB, 16.0);
  EXPECT_DOUBLE_EQ(s->zfetchHitPct, 75.0);

  s->segmentLabel = "8T-read";
  EXPECT_EQ(CODEC.classify(*s), Phase::READ);
  s->segmentLabel = "8T-write";
  EXPECT_EQ(CODEC.classify(*s), Phase::WRITE);
}

/** @test Collector name reflects L2ARC mode. */
TEST(ArcstatCollectorTest, CollectorName) {
  ArcstatConfig cfg;
  EXPECT_EQ(makeArcstatCollector(cfg)->name(), "arcstat");
  cfg.hasL2arc = true;
  EXPECT_EQ(makeArcstatCollector(cfg)->name(), "arcstat+l2arc");
}
