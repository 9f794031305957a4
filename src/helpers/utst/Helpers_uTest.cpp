/**
 * @file Helpers_uTest.cpp
 * @brief Unit tests for string, format and logging helpers.
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fmtx = poolscope::helpers::format;
namespace logx = poolscope::helpers::log;
namespace strx = poolscope::helpers::strings;

/* ----------------------------- Strings ----------------------------- */

/** @test Tabs and runs of spaces split alike. */
TEST(StringsTest, SplitFields) {
  const std::vector<std::string_view> F = strx::splitFields("  tank\t1.5T   2.5T\r\n");
  ASSERT_EQ(F.size(), 3U);
  EXPECT_EQ(F[0], "tank");
  EXPECT_EQ(F[2], "2.5T");
  EXPECT_TRUE(strx::splitFields(" \t ").empty());
}

/** @test Prefix, suffix and trim. */
TEST(StringsTest, Predicates) {
  EXPECT_TRUE(strx::startsWith("--pool", "--"));
  EXPECT_FALSE(strx::startsWith("-", "--"));
  EXPECT_TRUE(strx::endsWith("20T-read", "-read"));
  EXPECT_EQ(strx::trim("\t cache \n"), "cache");
  EXPECT_EQ(strx::trim("   "), "");
}

/* ----------------------------- Format ----------------------------- */

/** @test UTC ISO-8601 with milliseconds. */
TEST(FormatTest, IsoTimestamp) {
  EXPECT_EQ(fmtx::isoTimestamp(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(fmtx::isoTimestamp(1'700'000'000'123'456'789ULL), "2023-11-14T22:13:20.123Z");
}

/** @test Bandwidth switches to GB/s at 1024 MB/s. */
TEST(FormatTest, MegabytesPerSec) {
  EXPECT_EQ(fmtx::megabytesPerSec(512.0), "512.0 MB/s");
  EXPECT_EQ(fmtx::megabytesPerSec(2048.0), "2.00 GB/s");
}

/** @test Large values drop decimals. */
TEST(FormatTest, Number) {
  EXPECT_EQ(fmtx::number(1.5), "1.50");
  EXPECT_EQ(fmtx::number(123456.7), "123457");
}

/* ----------------------------- Clock ----------------------------- */

/** @test Realtime is past 2020 and strict stamps always increase. */
TEST(ClockTest, StrictlyIncreasing) {
  EXPECT_GT(poolscope::helpers::clock::realtimeNs(), 1'600'000'000'000'000'000ULL);

  poolscope::helpers::clock::StrictClock c;
  EXPECT_EQ(c.last(), 0U);
  std::uint64_t prev = c.next();
  for (int i = 0; i < 1000; ++i) {
    const std::uint64_t NOW = c.next();
    EXPECT_GT(NOW, prev);
    prev = NOW;
  }
  EXPECT_EQ(c.last(), prev);
}

/* ----------------------------- Log ----------------------------- */

/** @test Messages below the level are dropped; the sink sees formatted text. */
TEST(LogTest, LevelAndSink) {
  std::vector<std::pair<logx::Level, std::string>> seen;
  logx::setSink([&seen](logx::Level lvl, std::string_view msg) {
    seen.emplace_back(lvl, std::string(msg));
  });
  logx::setLevel(logx::Level::INFO);

  logx::debug("hidden {}", 1);
  logx::info("pool {} has {} samples", "tank", 42);
  logx::error("boom");

  logx::setLevel(logx::Level::OFF);
  logx::error("silenced");

  logx::resetSink();
  logx::setLevel(logx::Level::WARN);

  ASSERT_EQ(seen.size(), 2U);
  EXPECT_EQ(seen[0].first, logx::Level::INFO);
  EXPECT_EQ(seen[0].second, "pool tank has 42 samples");
  EXPECT_EQ(seen[1].first, logx::Level::ERROR);
}

/** @test enabled() follows the configured level. */
TEST(LogTest, Enabled) {
  logx::setLevel(logx::Level::WARN);
  EXPECT_FALSE(logx::enabled(logx::Level::INFO));
  EXPECT_TRUE(logx::enabled(logx::Level::ERROR));
  EXPECT_STREQ(logx::toString(logx::Level::WARN), "WARN");
}
