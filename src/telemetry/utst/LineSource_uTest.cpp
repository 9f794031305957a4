/**
 * @file LineSource_uTest.cpp
 * @brief Unit tests for the child-process line source.
 *
 * Uses /bin/sh as a stand-in telemetry tool.
 */

#include "src/telemetry/inc/LineSource.hpp"

#include <sys/wait.h>

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

using poolscope::telemetry::ProcessLineSource;
using poolscope::telemetry::ReadStatus;
using poolscope::telemetry::SourceStatus;
using poolscope::telemetry::toString;

namespace {

constexpr std::chrono::milliseconds READ_TIMEOUT{2000};

ProcessLineSource shell(const std::string& script, std::size_t discard = 0) {
  return ProcessLineSource({"/bin/sh", "-c", script}, discard);
}

std::vector<std::string> drain(ProcessLineSource& src) {
  std::vector<std::string> lines;
  std::string line;
  while (src.readLine(line, READ_TIMEOUT) == ReadStatus::LINE) {
    lines.push_back(line);
  }
  return lines;
}

} // namespace

/* ----------------------------- Reading ----------------------------- */

/** @test Lines arrive in order, then END; the child is reaped. */
TEST(ProcessLineSourceTest, ReadsLines) {
  ProcessLineSource src = shell("printf 'a\\nb\\n'");
  ASSERT_EQ(src.open(), SourceStatus::OK);
  EXPECT_GT(src.pid(), 0);

  const std::vector<std::string> LINES = drain(src);
  ASSERT_EQ(LINES.size(), 2U);
  EXPECT_EQ(LINES[0], "a");
  EXPECT_EQ(LINES[1], "b");

  std::string line;
  EXPECT_EQ(src.readLine(line, READ_TIMEOUT), ReadStatus::END);

  src.close();
  EXPECT_EQ(src.pid(), -1);
  EXPECT_TRUE(WIFEXITED(src.exitStatus()));
  EXPECT_EQ(WEXITSTATUS(src.exitStatus()), 0);
}

/** @test Leading lines are dropped when requested. */
TEST(ProcessLineSourceTest, DiscardsLeadingLines) {
  ProcessLineSource src = shell("printf 'since-boot\\nfirst\\nsecond\\n'", 1);
  ASSERT_EQ(src.open(), SourceStatus::OK);
  const std::vector<std::string> LINES = drain(src);
  ASSERT_EQ(LINES.size(), 2U);
  EXPECT_EQ(LINES[0], "first");
}

/** @test An unterminated final line and CR terminators are handled. */
TEST(ProcessLineSourceTest, PartialAndCrlfLines) {
  ProcessLineSource src = shell("printf 'one\\r\\ntail'");
  ASSERT_EQ(src.open(), SourceStatus::OK);
  const std::vector<std::string> LINES = drain(src);
  ASSERT_EQ(LINES.size(), 2U);
  EXPECT_EQ(LINES[0], "one");
  EXPECT_EQ(LINES[1], "tail");
}

/** @test Lines longer than MAX_LINE_BYTES are dropped without stalling later lines. */
TEST(ProcessLineSourceTest, OverlongLinesDropped) {
  static_assert(70000 > ProcessLineSource::MAX_LINE_BYTES);
  ProcessLineSource src = shell("head -c 70000 /dev/zero | tr '\\0' x; printf '\\nok\\n'; "
                                "head -c 70000 /dev/zero | tr '\\0' y");
  ASSERT_EQ(src.open(), SourceStatus::OK);
  const std::vector<std::string> LINES = drain(src);
  ASSERT_EQ(LINES.size(), 1U);
  EXPECT_EQ(LINES[0], "ok");
}

/** @test A silent child yields TIMEOUT and is terminated by close(). */
TEST(ProcessLineSourceTest, TimeoutAndTerminate) {
  ProcessLineSource src = shell("exec sleep 30");
  ASSERT_EQ(src.open(), SourceStatus::OK);

  std::string line;
  EXPECT_EQ(src.readLine(line, std::chrono::milliseconds(50)), ReadStatus::TIMEOUT);

  const auto BEGIN = std::chrono::steady_clock::now();
  src.close();
  EXPECT_LT(std::chrono::steady_clock::now() - BEGIN, ProcessLineSource::TERM_GRACE);
  EXPECT_EQ(src.pid(), -1);
  EXPECT_TRUE(WIFSIGNALED(src.exitStatus()));
}

/** @test A source can be reopened after close(). */
TEST(ProcessLineSourceTest, Reopen) {
  ProcessLineSource src = shell("echo x");
  ASSERT_EQ(src.open(), SourceStatus::OK);
  EXPECT_EQ(drain(src).size(), 1U);
  src.close();

  ASSERT_EQ(src.open(), SourceStatus::OK);
  const std::vector<std::string> LINES = drain(src);
  ASSERT_EQ(LINES.size(), 1U);
  EXPECT_EQ(LINES[0], "x");
}

/* ----------------------------- Errors ----------------------------- */

/** @test A missing executable is reported as NOT_FOUND. */
TEST(ProcessLineSourceTest, MissingExecutable) {
  ProcessLineSource src({"/nonexistent/poolscope-tool", "iostat"});
  EXPECT_EQ(src.open(), SourceStatus::NOT_FOUND);
  EXPECT_EQ(src.pid(), -1);
}

/** @test An empty command is rejected without forking. */
TEST(ProcessLineSourceTest, EmptyCommand) {
  ProcessLineSource src(std::vector<std::string>{});
  EXPECT_EQ(src.open(), SourceStatus::INVALID_ARGUMENT);
}

/** @test Reading an unopened source reports END. */
TEST(ProcessLineSourceTest, ReadBeforeOpen) {
  ProcessLineSource src({"/bin/true"});
  std::string line;
  EXPECT_EQ(src.readLine(line, std::chrono::milliseconds(10)), ReadStatus::END);
}

/** @test describe() joins the command line. */
TEST(ProcessLineSourceTest, Describe) {
  ProcessLineSource src({"zpool", "iostat", "-H", "tank", "1"});
  EXPECT_EQ(src.describe(), "zpool iostat -H tank 1");
}

/** @test Status names are stable. */
TEST(ProcessLineSourceTest, StatusNames) {
  EXPECT_STREQ(toString(SourceStatus::NOT_FOUND), "executable not found");
  EXPECT_STREQ(toString(ReadStatus::TIMEOUT), "timeout");
}
