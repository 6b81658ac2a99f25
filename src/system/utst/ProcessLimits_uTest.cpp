/**
 * @file ProcessLimits_uTest.cpp
 * @brief Unit tests for echobench::system::ProcessLimits.
 *
 * Notes:
 *  - Tests are platform-agnostic: assert invariants, not exact values.
 *  - Actual limit values vary by system configuration and user privileges.
 *  - ensureFdCapacity only ever raises the soft limit, so running it with
 *    small requirements leaves the test process unchanged.
 */

#include "src/system/inc/ProcessLimits.hpp"

#include <gtest/gtest.h>

#include <sys/resource.h> // RLIMIT_* constants

#include <string>

using echobench::system::ensureFdCapacity;
using echobench::system::FdCapacityResult;
using echobench::system::formatLimit;
using echobench::system::getRlimit;
using echobench::system::requiredFdCount;
using echobench::system::RESERVED_FDS;
using echobench::system::RLIMIT_UNLIMITED_VALUE;
using echobench::system::RlimitResourceLimiter;
using echobench::system::RlimitValue;

/* ----------------------------- RlimitValue Tests ----------------------------- */

/** @test RlimitValue::canIncreaseTo for unlimited hard limit. */
TEST(RlimitValueTest, CanIncreaseToUnlimited) {
  RlimitValue val{};
  val.soft = 100;
  val.hard = RLIMIT_UNLIMITED_VALUE;

  EXPECT_TRUE(val.canIncreaseTo(1000000));
  EXPECT_TRUE(val.canIncreaseTo(RLIMIT_UNLIMITED_VALUE));
}

/** @test RlimitValue::canIncreaseTo for limited hard limit. */
TEST(RlimitValueTest, CanIncreaseToLimited) {
  RlimitValue val{};
  val.soft = 100;
  val.hard = 1000;

  EXPECT_TRUE(val.canIncreaseTo(500));
  EXPECT_TRUE(val.canIncreaseTo(1000));
  EXPECT_FALSE(val.canIncreaseTo(1001));
}

/** @test RlimitValue::hasAtLeast for unlimited. */
TEST(RlimitValueTest, HasAtLeastUnlimited) {
  RlimitValue val{};
  val.unlimited = true;
  val.soft = RLIMIT_UNLIMITED_VALUE;

  EXPECT_TRUE(val.hasAtLeast(0));
  EXPECT_TRUE(val.hasAtLeast(1000000000ULL));
}

/** @test RlimitValue::hasAtLeast for limited. */
TEST(RlimitValueTest, HasAtLeastLimited) {
  RlimitValue val{};
  val.soft = 1000;
  val.hard = 2000;

  EXPECT_TRUE(val.hasAtLeast(500));
  EXPECT_TRUE(val.hasAtLeast(1000));
  EXPECT_FALSE(val.hasAtLeast(1001));
}

/* ----------------------------- requiredFdCount Tests ----------------------------- */

/** @test Requirement reserves the standard streams. */
TEST(RequiredFdCountTest, AddsReserved) {
  EXPECT_EQ(RESERVED_FDS, 3U);
  EXPECT_EQ(requiredFdCount(0), 3U);
  EXPECT_EQ(requiredFdCount(50), 53U);
}

/** @test Requirement saturates instead of wrapping. */
TEST(RequiredFdCountTest, Saturates) {
  EXPECT_EQ(requiredFdCount(RLIMIT_UNLIMITED_VALUE), RLIMIT_UNLIMITED_VALUE);
  EXPECT_EQ(requiredFdCount(RLIMIT_UNLIMITED_VALUE - 1), RLIMIT_UNLIMITED_VALUE);
}

/* ----------------------------- ensureFdCapacity Tests ----------------------------- */

/** @test A single connection always fits. */
TEST(EnsureFdCapacityTest, SingleConnectionSucceeds) {
  const FdCapacityResult RESULT = ensureFdCapacity(1);

  EXPECT_TRUE(RESULT.success) << RESULT.error;
  EXPECT_EQ(RESULT.required, 4U);
  EXPECT_TRUE(RESULT.after.hasAtLeast(RESULT.required));
  EXPECT_TRUE(RESULT.error.empty());
}

/** @test The soft limit is never lowered. */
TEST(EnsureFdCapacityTest, NeverLowersSoftLimit) {
  const RlimitValue BEFORE = getRlimit(RLIMIT_NOFILE);
  const FdCapacityResult RESULT = ensureFdCapacity(0);
  const RlimitValue AFTER = getRlimit(RLIMIT_NOFILE);

  ASSERT_TRUE(RESULT.success) << RESULT.error;
  EXPECT_FALSE(RESULT.raised);
  EXPECT_EQ(AFTER.soft, BEFORE.soft);
  EXPECT_EQ(AFTER.hard, BEFORE.hard);
}

/** @test A requirement above the hard limit fails and names the hard limit. */
TEST(EnsureFdCapacityTest, AboveHardLimitFails) {
  const RlimitValue CURRENT = getRlimit(RLIMIT_NOFILE);
  if (CURRENT.hard == RLIMIT_UNLIMITED_VALUE) {
    GTEST_SKIP() << "NOFILE hard limit is unlimited";
  }

  const FdCapacityResult RESULT = ensureFdCapacity(CURRENT.hard);

  EXPECT_FALSE(RESULT.success);
  EXPECT_FALSE(RESULT.raised);
  EXPECT_NE(RESULT.error.find("hard limit"), std::string::npos);
  EXPECT_NE(RESULT.error.find(formatLimit(CURRENT.hard)), std::string::npos);

  // Nothing changed
  const RlimitValue AFTER = getRlimit(RLIMIT_NOFILE);
  EXPECT_EQ(AFTER.soft, CURRENT.soft);
}

/** @test Raising up to the hard limit succeeds. */
TEST(EnsureFdCapacityTest, RaisesToHardLimit) {
  const RlimitValue CURRENT = getRlimit(RLIMIT_NOFILE);
  if (CURRENT.hard == RLIMIT_UNLIMITED_VALUE || CURRENT.hard < RESERVED_FDS ||
      CURRENT.soft >= CURRENT.hard) {
    GTEST_SKIP() << "No headroom between soft and hard NOFILE limits";
  }

  const FdCapacityResult RESULT = ensureFdCapacity(CURRENT.hard - RESERVED_FDS);

  EXPECT_TRUE(RESULT.success) << RESULT.error;
  EXPECT_TRUE(RESULT.raised);
  EXPECT_EQ(RESULT.after.soft, CURRENT.hard);
}

/** @test The limiter class delegates to ensureFdCapacity. */
TEST(EnsureFdCapacityTest, LimiterDelegates) {
  RlimitResourceLimiter limiter;
  const FdCapacityResult RESULT = limiter.ensureCapacity(2);

  EXPECT_TRUE(RESULT.success) << RESULT.error;
  EXPECT_EQ(RESULT.required, 5U);
}

/* ----------------------------- FdCapacityResult Tests ----------------------------- */

/** @test toString reports failures with the error text. */
TEST(FdCapacityResultTest, ToStringFailure) {
  FdCapacityResult r{};
  r.error = "the hard limit of this process is only 64";

  const std::string OUTPUT = r.toString();
  EXPECT_NE(OUTPUT.find("FAILED"), std::string::npos);
  EXPECT_NE(OUTPUT.find("only 64"), std::string::npos);
}

/** @test toString reports the raise. */
TEST(FdCapacityResultTest, ToStringRaised) {
  FdCapacityResult r{};
  r.success = true;
  r.raised = true;
  r.required = 53;
  r.before.soft = 16;
  r.after.soft = 53;
  r.after.hard = RLIMIT_UNLIMITED_VALUE;

  const std::string OUTPUT = r.toString();
  EXPECT_NE(OUTPUT.find("required=53"), std::string::npos);
  EXPECT_NE(OUTPUT.find("raised from 16"), std::string::npos);
  EXPECT_NE(OUTPUT.find("hard=unlimited"), std::string::npos);
}

/* ----------------------------- formatLimit Tests ----------------------------- */

/** @test formatLimit handles unlimited. */
TEST(FormatLimitTest, Unlimited) { EXPECT_EQ(formatLimit(RLIMIT_UNLIMITED_VALUE), "unlimited"); }

/** @test formatLimit handles counts. */
TEST(FormatLimitTest, Counts) {
  EXPECT_EQ(formatLimit(0), "0");
  EXPECT_EQ(formatLimit(1024), "1024");
}

/* ----------------------------- getRlimit Tests ----------------------------- */

/** @test getRlimit returns valid structure. */
TEST(GetRlimitTest, ReturnsValidStructure) {
  const RlimitValue VAL = getRlimit(RLIMIT_NOFILE);

  if (!VAL.unlimited && VAL.hard != RLIMIT_UNLIMITED_VALUE) {
    EXPECT_LE(VAL.soft, VAL.hard);
  }
  // stdin/stdout/stderr are open
  EXPECT_TRUE(VAL.hasAtLeast(3));
}

/** @test getRlimit handles invalid resource gracefully. */
TEST(GetRlimitTest, InvalidResourceReturnsZero) {
  const RlimitValue VAL = getRlimit(-1);
  EXPECT_EQ(VAL.soft, 0U);
  EXPECT_EQ(VAL.hard, 0U);
  EXPECT_FALSE(VAL.unlimited);
}
