/**
 * @file PhaseClassifier_uTest.cpp
 * @brief Unit tests for phase classification, steady-state labels and I/O size.
 */

#include "src/telemetry/inc/PhaseClassifier.hpp"

#include <gtest/gtest.h>

#include <vector>

using poolscope::telemetry::ArcSample;
using poolscope::telemetry::classifyPhase;
using poolscope::telemetry::ClassifierConfig;
using poolscope::telemetry::computeIoSizeByPhase;
using poolscope::telemetry::IoSizeStats;
using poolscope::telemetry::isSteadyStateLabel;
using poolscope::telemetry::Phase;
using poolscope::telemetry::phaseBreakdown;
using poolscope::telemetry::PhaseBreakdown;
using poolscope::telemetry::phaseFromLabel;
using poolscope::telemetry::PoolSample;

namespace {

PoolSample bw(double readMBps, double writeMBps) {
  PoolSample s;
  s.readBandwidthMBps = readMBps;
  s.writeBandwidthMBps = writeMBps;
  return s;
}

} // namespace

/* ----------------------------- classifyPhase ----------------------------- */

/** @test Four activity classes. */
TEST(PhaseClassifierTest, Classes) {
  EXPECT_EQ(classifyPhase(bw(0.0, 0.0)), Phase::IDLE);
  EXPECT_EQ(classifyPhase(bw(100.0, 0.0)), Phase::READ);
  EXPECT_EQ(classifyPhase(bw(0.0, 100.0)), Phase::WRITE);
  EXPECT_EQ(classifyPhase(bw(100.0, 100.0)), Phase::MIXED);
}

/** @test Epsilon is inclusive for idle. */
TEST(PhaseClassifierTest, EpsilonBoundary) {
  EXPECT_EQ(classifyPhase(bw(0.5, 0.5)), Phase::IDLE);
  EXPECT_EQ(classifyPhase(bw(0.51, 0.5)), Phase::READ);

  ClassifierConfig cfg;
  cfg.idleEpsilonMBps = 10.0;
  EXPECT_EQ(classifyPhase(bw(5.0, 50.0), cfg), Phase::WRITE);
}

/** @test ARC phase comes from the label suffix. */
TEST(PhaseClassifierTest, ArcFromLabel) {
  EXPECT_EQ(phaseFromLabel("20T-read"), Phase::READ);
  EXPECT_EQ(phaseFromLabel("20T-write"), Phase::WRITE);
  EXPECT_EQ(phaseFromLabel("warmup"), Phase::IDLE);
  EXPECT_EQ(phaseFromLabel(""), Phase::IDLE);

  ArcSample a;
  a.segmentLabel = "4T-read";
  EXPECT_EQ(classifyPhase(a), Phase::READ);
}

/** @test Reserved labels are not steady state. */
TEST(PhaseClassifierTest, SteadyStateLabels) {
  EXPECT_FALSE(isSteadyStateLabel(""));
  EXPECT_FALSE(isSteadyStateLabel("warmup"));
  EXPECT_FALSE(isSteadyStateLabel("cooldown"));
  EXPECT_TRUE(isSteadyStateLabel("1T-write"));
  EXPECT_TRUE(isSteadyStateLabel("run"));
}

/* ----------------------------- phaseBreakdown ----------------------------- */

/** @test Counts and percentages per phase. */
TEST(PhaseClassifierTest, Breakdown) {
  std::vector<PoolSample> v(4);
  v[0].phase = Phase::IDLE;
  v[1].phase = Phase::WRITE;
  v[2].phase = Phase::WRITE;
  v[3].phase = Phase::READ;

  const PhaseBreakdown B = phaseBreakdown(v);
  EXPECT_EQ(B.total, 4U);
  EXPECT_EQ(B.count(Phase::WRITE), 2U);
  EXPECT_EQ(B.count(Phase::MIXED), 0U);
  EXPECT_DOUBLE_EQ(B.percent(Phase::WRITE), 50.0);
  EXPECT_DOUBLE_EQ(B.percent(Phase::READ), 25.0);
  EXPECT_NE(B.toString().find("write=2"), std::string::npos);
  EXPECT_EQ(PhaseBreakdown{}.percent(Phase::IDLE), 0.0);
}

/* ----------------------------- computeIoSizeByPhase ----------------------------- */

/** @test Request size is bandwidth over IOPS, per phase. */
TEST(PhaseClassifierTest, IoSizeByPhase) {
  std::vector<PoolSample> v;

  PoolSample r = bw(128.0, 0.0);
  r.readIops = 1024.0;
  r.phase = Phase::READ;
  v.push_back(r);
  r.readBandwidthMBps = 64.0;
  v.push_back(r);

  PoolSample w = bw(0.0, 4.0);
  w.writeIops = 1024.0;
  w.phase = Phase::WRITE;
  v.push_back(w);

  PoolSample idle;
  idle.phase = Phase::IDLE;
  v.push_back(idle);

  const std::vector<IoSizeStats> OUT = computeIoSizeByPhase(v);
  ASSERT_EQ(OUT.size(), 2U);

  EXPECT_EQ(OUT[0].phase, Phase::READ);
  EXPECT_EQ(OUT[0].sampleCount, 2U);
  EXPECT_DOUBLE_EQ(OUT[0].readKiBPerOp.mean, 96.0);
  EXPECT_EQ(OUT[0].writeKiBPerOp.count, 0U);

  EXPECT_EQ(OUT[1].phase, Phase::WRITE);
  EXPECT_DOUBLE_EQ(OUT[1].writeKiBPerOp.mean, 4.0);
}

/** @test Zero IOPS samples are skipped, not divided. */
TEST(PhaseClassifierTest, IoSizeZeroIops) {
  std::vector<PoolSample> v(1, bw(100.0, 0.0));
  v[0].phase = Phase::READ;
  const auto OUT = computeIoSizeByPhase(v);
  ASSERT_EQ(OUT.size(), 1U);
  EXPECT_EQ(OUT[0].sampleCount, 1U);
  EXPECT_EQ(OUT[0].readKiBPerOp.count, 0U);
}
