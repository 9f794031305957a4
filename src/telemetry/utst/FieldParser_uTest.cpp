/**
 * @file FieldParser_uTest.cpp
 * @brief Unit tests for zpool iostat / arcstat line parsing.
 *
 * The golden iostat line uses a distinct value in every column so that any
 * read/write or field-group misalignment shows up as a wrong member.
 */

#include "src/telemetry/inc/FieldParser.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using poolscope::telemetry::ArcSample;
using poolscope::telemetry::arcstatColumns;
using poolscope::telemetry::arcstatFieldList;
using poolscope::telemetry::IoDirection;
using poolscope::telemetry::IOSTAT_COLUMNS;
using poolscope::telemetry::IOSTAT_LAYOUT_VERSION;
using poolscope::telemetry::IostatField;
using poolscope::telemetry::parseArcstatLine;
using poolscope::telemetry::parseIostatLine;
using poolscope::telemetry::ParseWarning;
using poolscope::telemetry::PoolSample;

namespace {

constexpr const char* GOLDEN = "tank\t1.5T\t2.5T\t100\t200\t1.23M\t4.5M\t500us\t2ms\t400us\t1ms\t"
                               "50us\t300us\t20us\t700us\t-\t-";

} // namespace

/* ----------------------------- Column Table ----------------------------- */

/** @test Table indices are dense and read/write pairs interleave. */
TEST(FieldParserTest, ColumnTableInterleaved) {
  EXPECT_EQ(IOSTAT_LAYOUT_VERSION, 2);
  for (std::size_t i = 0; i < IOSTAT_COLUMNS.size(); ++i) {
    EXPECT_EQ(IOSTAT_COLUMNS[i].index, i);
  }
  for (std::size_t i = 3; i <= 13; i += 2) {
    EXPECT_EQ(IOSTAT_COLUMNS[i].direction, IoDirection::READ) << "column " << i;
    EXPECT_EQ(IOSTAT_COLUMNS[i + 1].direction, IoDirection::WRITE) << "column " << i + 1;
    EXPECT_EQ(IOSTAT_COLUMNS[i].field, IOSTAT_COLUMNS[i + 1].field) << "column " << i;
  }
  EXPECT_EQ(IOSTAT_COLUMNS[7].field, IostatField::TOTAL_WAIT);
  EXPECT_EQ(IOSTAT_COLUMNS[9].field, IostatField::DISK_WAIT);
}

/* ----------------------------- Iostat ----------------------------- */

/** @test Golden line maps every column to the right member. */
TEST(FieldParserTest, GoldenIostatLine) {
  std::vector<ParseWarning> warnings;
  const std::optional<PoolSample> S = parseIostatLine(GOLDEN, warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_TRUE(warnings.empty());

  EXPECT_EQ(S->poolName, "tank");
  EXPECT_DOUBLE_EQ(S->allocGiB, 1536.0);
  EXPECT_DOUBLE_EQ(S->freeGiB, 2560.0);
  EXPECT_DOUBLE_EQ(S->readIops, 100.0);
  EXPECT_DOUBLE_EQ(S->writeIops, 200.0);
  EXPECT_DOUBLE_EQ(S->readBandwidthMBps, 1.23);
  EXPECT_DOUBLE_EQ(S->writeBandwidthMBps, 4.5);

  EXPECT_DOUBLE_EQ(S->read.totalWaitMs, 0.5);
  EXPECT_DOUBLE_EQ(S->write.totalWaitMs, 2.0);
  EXPECT_DOUBLE_EQ(S->read.diskWaitMs, 0.4);
  EXPECT_DOUBLE_EQ(S->write.diskWaitMs, 1.0);
  EXPECT_DOUBLE_EQ(S->read.syncQueueWaitMs, 0.05);
  EXPECT_DOUBLE_EQ(S->write.syncQueueWaitMs, 0.3);
  EXPECT_DOUBLE_EQ(S->read.asyncQueueWaitMs, 0.02);
  EXPECT_DOUBLE_EQ(S->write.asyncQueueWaitMs, 0.7);

  EXPECT_EQ(S->scrubWaitMs, 0.0);
  EXPECT_EQ(S->trimWaitMs, 0.0);
  EXPECT_TRUE(S->segmentLabel.empty());
  EXPECT_EQ(S->timestampNs, 0U);
}

/** @test Space-aligned output tokenizes like tab-separated output. */
TEST(FieldParserTest, SpaceSeparated) {
  std::vector<ParseWarning> warnings;
  const auto S = parseIostatLine("tank   1.5T  2.5T   100   200  1.23M  4.5M", warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_DOUBLE_EQ(S->writeBandwidthMBps, 4.5);
}

/** @test Basic-only lines leave latency at zero. */
TEST(FieldParserTest, BasicColumnsOnly) {
  std::vector<ParseWarning> warnings;
  const auto S = parseIostatLine("tank 1T 1T 10 20 1M 2M", warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_DOUBLE_EQ(S->readIops, 10.0);
  EXPECT_DOUBLE_EQ(S->writeBandwidthMBps, 2.0);
  EXPECT_EQ(S->read.totalWaitMs, 0.0);
  EXPECT_EQ(S->write.asyncQueueWaitMs, 0.0);
  EXPECT_TRUE(warnings.empty());
}

/** @test Truncated latency block is ignored rather than partially read. */
TEST(FieldParserTest, PartialLatencyIgnored) {
  std::vector<ParseWarning> warnings;
  const auto S = parseIostatLine("tank 1T 1T 10 20 1M 2M 5ms 6ms 7ms", warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_EQ(S->read.totalWaitMs, 0.0);
  EXPECT_EQ(S->write.totalWaitMs, 0.0);
}

/** @test Headers, separators, blanks and short lines yield nothing. */
TEST(FieldParserTest, NonDataLines) {
  std::vector<ParseWarning> warnings;
  EXPECT_FALSE(parseIostatLine("", warnings).has_value());
  EXPECT_FALSE(parseIostatLine("   \t ", warnings).has_value());
  EXPECT_FALSE(parseIostatLine("capacity operations bandwidth total_wait", warnings).has_value());
  EXPECT_FALSE(parseIostatLine("pool alloc free read write read write read write", warnings)
                   .has_value());
  EXPECT_FALSE(parseIostatLine("----- ----- ----- ----- ----- ----- -----", warnings).has_value());
  EXPECT_FALSE(parseIostatLine("tank 1T 1T 10 20 1M", warnings).has_value());
  EXPECT_FALSE(parseIostatLine("capacity operations bandwidth total_wait disk_wait syncq_wait "
                               "asyncq_wait scrub trim",
                               warnings)
                   .has_value());
  EXPECT_TRUE(warnings.empty());
}

/** @test Pools named like header words still produce samples. */
TEST(FieldParserTest, PoolNamedLikeHeader) {
  for (const char* name : {"pool", "capacity", "operations"}) {
    std::vector<ParseWarning> warnings;
    const std::string LINE = std::string(name) + "\t1.5T\t2.5T\t100\t200\t1.23M\t4.5M";
    const std::optional<PoolSample> S = parseIostatLine(LINE, warnings);
    ASSERT_TRUE(S.has_value()) << name;
    EXPECT_EQ(S->poolName, name);
    EXPECT_DOUBLE_EQ(S->readIops, 100.0);
    EXPECT_DOUBLE_EQ(S->writeBandwidthMBps, 4.5);
    EXPECT_TRUE(warnings.empty());
  }
}

/** @test A bad token zeroes only its field and records a warning. */
TEST(FieldParserTest, MalformedFieldWarns) {
  std::vector<ParseWarning> warnings;
  const auto S = parseIostatLine("tank 1T 1T 10 abc 1M 2M", warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_EQ(S->writeIops, 0.0);
  EXPECT_DOUBLE_EQ(S->readIops, 10.0);
  EXPECT_DOUBLE_EQ(S->writeBandwidthMBps, 2.0);

  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].column, 4U);
  EXPECT_EQ(warnings[0].field, "write_ops");
  EXPECT_EQ(warnings[0].token, "abc");
  EXPECT_NE(warnings[0].toString().find("write_ops"), std::string::npos);
}

/** @test Trailing scrub/trim columns are read when reported. */
TEST(FieldParserTest, ScrubTrimColumns) {
  std::vector<ParseWarning> warnings;
  const std::string LINE = "tank 1T 1T 1 1 1M 1M 1ms 1ms 1ms 1ms 1ms 1ms 1ms 1ms 3ms 4ms";
  const auto S = parseIostatLine(LINE, warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_DOUBLE_EQ(S->scrubWaitMs, 3.0);
  EXPECT_DOUBLE_EQ(S->trimWaitMs, 4.0);
}

/* ----------------------------- Arcstat ----------------------------- */

/** @test Field list follows the L2ARC flag. */
TEST(FieldParserTest, ArcstatFieldList) {
  EXPECT_EQ(arcstatFieldList(false),
            "hit%,miss%,arcsz,read,hits,miss,dh%,ph%,mrusz%,mfusz%,zhits,zmisses");
  EXPECT_EQ(arcstatFieldList(true), "hit%,miss%,arcsz,read,hits,miss,dh%,ph%,mrusz%,mfusz%,"
                                    "l2hit%,l2size,l2bytes,zhits,zmisses");
  EXPECT_EQ(arcstatColumns(false).size(), 12U);
  EXPECT_EQ(arcstatColumns(true).size(), 15U);
}

/** @test Core + prefetch line without L2ARC. */
TEST(FieldParserTest, ArcstatCoreLine) {
  std::vector<ParseWarning> warnings;
  const std::optional<ArcSample> S =
      parseArcstatLine("87 13 8589934592 1500 1300 200 90 40 60 40 300 100", false, warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_TRUE(warnings.empty());
  EXPECT_DOUBLE_EQ(S->hitPct, 87.0);
  EXPECT_DOUBLE_EQ(S->missPct, 13.0);
  EXPECT_DOUBLE_EQ(S->arcSizeGiB, 8.0);
  EXPECT_DOUBLE_EQ(S->readsPerSec, 1500.0);
  EXPECT_DOUBLE_EQ(S->hitsPerSec, 1300.0);
  EXPECT_DOUBLE_EQ(S->missesPerSec, 200.0);
  EXPECT_DOUBLE_EQ(S->demandHitPct, 90.0);
  EXPECT_DOUBLE_EQ(S->prefetchHitPct, 40.0);
  EXPECT_DOUBLE_EQ(S->mruPct, 60.0);
  EXPECT_DOUBLE_EQ(S->mfuPct, 40.0);
  EXPECT_DOUBLE_EQ(S->zfetchHitPct, 75.0);
  EXPECT_FALSE(S->hasL2arc());
  EXPECT_FALSE(S->l2arcSizeGiB.has_value());
  EXPECT_FALSE(S->l2arcReadMBps.has_value());
}

/** @test L2ARC fields sit before the prefetch counters. */
TEST(FieldParserTest, ArcstatL2arcLine) {
  std::vector<ParseWarning> warnings;
  const auto S = parseArcstatLine(
      "87 13 8589934592 1500 1300 200 90 40 60 40 25 107374182400 10485760 300 100", true,
      warnings);
  ASSERT_TRUE(S.has_value());
  ASSERT_TRUE(S->hasL2arc());
  EXPECT_DOUBLE_EQ(*S->l2arcHitPct, 25.0);
  EXPECT_DOUBLE_EQ(*S->l2arcSizeGiB, 100.0);
  EXPECT_DOUBLE_EQ(*S->l2arcReadMBps, 10.0);
  EXPECT_DOUBLE_EQ(S->hitsPerSec, 1300.0);
  EXPECT_DOUBLE_EQ(S->zfetchHitPct, 75.0);
}

/** @test Zero prefetch lookups give a zero hit ratio. */
TEST(FieldParserTest, ArcstatZeroPrefetch) {
  std::vector<ParseWarning> warnings;
  const auto S = parseArcstatLine("87 13 1073741824 0 0 0 0 0 50 50 0 0", false, warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_EQ(S->zfetchHitPct, 0.0);
}

/** @test Header and short lines yield nothing. */
TEST(FieldParserTest, ArcstatNonDataLines) {
  std::vector<ParseWarning> warnings;
  EXPECT_FALSE(parseArcstatLine("hit%  miss%  arcsz  read  hits  miss  dh%  ph%  mrusz%  mfusz%  "
                                "zhits  zmisses",
                                false, warnings)
                   .has_value());
  EXPECT_FALSE(parseArcstatLine("", false, warnings).has_value());
  EXPECT_FALSE(parseArcstatLine("87 13 8589934592", false, warnings).has_value());
  // A no-L2ARC line is too short for the L2ARC field set
  EXPECT_FALSE(
      parseArcstatLine("87 13 8589934592 1500 1300 200 90 40 60 40 300 100", true, warnings)
          .has_value());
}

/** @test Malformed arcstat field is zeroed with a warning. */
TEST(FieldParserTest, ArcstatMalformed) {
  std::vector<ParseWarning> warnings;
  const auto S = parseArcstatLine("87 x 8589934592 1500 1300 200 90 40 60 40 300 100", false, warnings);
  ASSERT_TRUE(S.has_value());
  EXPECT_EQ(S->missPct, 0.0);
  ASSERT_EQ(warnings.size(), 1U);
  EXPECT_EQ(warnings[0].field, "miss%");
}
