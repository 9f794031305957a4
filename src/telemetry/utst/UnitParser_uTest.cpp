/**
 * @file UnitParser_uTest.cpp
 * @brief Unit tests for poolscope::telemetry::parseScaled.
 */

#include "src/telemetry/inc/UnitParser.hpp"

#include <gtest/gtest.h>

using poolscope::telemetry::parseScaled;
using poolscope::telemetry::ScaledValue;
using poolscope::telemetry::TokenStatus;
using poolscope::telemetry::UnitFamily;

/* ----------------------------- Counts ----------------------------- */

/** @test Decimal count suffixes. */
TEST(UnitParserTest, CountSuffixes) {
  EXPECT_DOUBLE_EQ(parseScaled("42", UnitFamily::COUNT).value, 42.0);
  EXPECT_DOUBLE_EQ(parseScaled("1.5K", UnitFamily::COUNT).value, 1500.0);
  EXPECT_DOUBLE_EQ(parseScaled("2M", UnitFamily::COUNT).value, 2.0e6);
  EXPECT_DOUBLE_EQ(parseScaled("3G", UnitFamily::COUNT).value, 3.0e9);
  EXPECT_DOUBLE_EQ(parseScaled("1T", UnitFamily::COUNT).value, 1.0e12);
}

/* ----------------------------- Bandwidth / Size ----------------------------- */

/** @test Bandwidth converts to MB/s with binary multipliers. */
TEST(UnitParserTest, BandwidthToMBps) {
  EXPECT_DOUBLE_EQ(parseScaled("1.23M", UnitFamily::BANDWIDTH).value, 1.23);
  EXPECT_DOUBLE_EQ(parseScaled("512K", UnitFamily::BANDWIDTH).value, 0.5);
  EXPECT_DOUBLE_EQ(parseScaled("2G", UnitFamily::BANDWIDTH).value, 2048.0);
  EXPECT_DOUBLE_EQ(parseScaled("1T", UnitFamily::BANDWIDTH).value, 1048576.0);
  EXPECT_DOUBLE_EQ(parseScaled("1048576", UnitFamily::BANDWIDTH).value, 1.0);
  EXPECT_DOUBLE_EQ(parseScaled("0", UnitFamily::BANDWIDTH).value, 0.0);
}

/** @test Byte unit spellings are accepted. */
TEST(UnitParserTest, BandwidthSpellings) {
  EXPECT_DOUBLE_EQ(parseScaled("4MiB", UnitFamily::BANDWIDTH).value, 4.0);
  EXPECT_DOUBLE_EQ(parseScaled("4MB", UnitFamily::BANDWIDTH).value, 4.0);
  EXPECT_DOUBLE_EQ(parseScaled("4M/s", UnitFamily::BANDWIDTH).value, 4.0);
  EXPECT_DOUBLE_EQ(parseScaled("1024KB/s", UnitFamily::BANDWIDTH).value, 1.0);
}

/** @test Sizes convert to GiB. */
TEST(UnitParserTest, SizeToGiB) {
  EXPECT_DOUBLE_EQ(parseScaled("1.5T", UnitFamily::SIZE).value, 1536.0);
  EXPECT_DOUBLE_EQ(parseScaled("512M", UnitFamily::SIZE).value, 0.5);
  EXPECT_DOUBLE_EQ(parseScaled("1073741824", UnitFamily::SIZE).value, 1.0);
  EXPECT_DOUBLE_EQ(parseScaled("2P", UnitFamily::SIZE).value, 2.0 * 1024.0 * 1024.0);
}

/* ----------------------------- Time ----------------------------- */

/** @test Time converts to milliseconds; bare numbers are nanoseconds. */
TEST(UnitParserTest, TimeToMs) {
  EXPECT_DOUBLE_EQ(parseScaled("500us", UnitFamily::TIME).value, 0.5);
  EXPECT_DOUBLE_EQ(parseScaled("3ms", UnitFamily::TIME).value, 3.0);
  EXPECT_DOUBLE_EQ(parseScaled("2s", UnitFamily::TIME).value, 2000.0);
  EXPECT_DOUBLE_EQ(parseScaled("250ns", UnitFamily::TIME).value, 0.00025);
  EXPECT_DOUBLE_EQ(parseScaled("1500000", UnitFamily::TIME).value, 1.5);
  EXPECT_DOUBLE_EQ(parseScaled("20\xC2\xB5s", UnitFamily::TIME).value, 0.02);
}

/* ----------------------------- Percent ----------------------------- */

/** @test Percent accepts an optional sign. */
TEST(UnitParserTest, Percent) {
  EXPECT_DOUBLE_EQ(parseScaled("87", UnitFamily::PERCENT).value, 87.0);
  EXPECT_DOUBLE_EQ(parseScaled("87.5%", UnitFamily::PERCENT).value, 87.5);
  EXPECT_FALSE(parseScaled("87K", UnitFamily::PERCENT).ok());
}

/* ----------------------------- Placeholders / Errors ----------------------------- */

/** @test "-" is not reported, not malformed. */
TEST(UnitParserTest, DashIsNotReported) {
  for (UnitFamily f : {UnitFamily::COUNT, UnitFamily::SIZE, UnitFamily::BANDWIDTH,
                       UnitFamily::TIME, UnitFamily::PERCENT}) {
    const ScaledValue V = parseScaled("-", f);
    EXPECT_EQ(V.status, TokenStatus::NOT_REPORTED);
    EXPECT_TRUE(V.ok());
    EXPECT_EQ(V.value, 0.0);
  }
}

/** @test Garbage is malformed and zero. */
TEST(UnitParserTest, Malformed) {
  const char* const BAD[] = {"", "abc", "1.2X", "12ms3", "-5", "nan", "inf", "1.2.3M", "M"};
  for (const char* tok : BAD) {
    const ScaledValue V = parseScaled(tok, UnitFamily::BANDWIDTH);
    EXPECT_EQ(V.status, TokenStatus::MALFORMED) << "token '" << tok << "'";
    EXPECT_EQ(V.value, 0.0) << "token '" << tok << "'";
  }
  EXPECT_FALSE(parseScaled("5m", UnitFamily::TIME).ok());
  EXPECT_FALSE(parseScaled("5KK", UnitFamily::COUNT).ok());
}

/** @test Status names. */
TEST(UnitParserTest, ToString) {
  EXPECT_STREQ(toString(TokenStatus::MALFORMED), "malformed");
  EXPECT_STREQ(toString(UnitFamily::BANDWIDTH), "bandwidth");
}
