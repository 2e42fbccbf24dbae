/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using blockforge::log::Error;
using blockforge::log::Level;
using blockforge::log::str2lvl;
using blockforge::log::tuneLoggingSystem;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given level names and their short forms
 * @when parsing them
 * @then matching levels are returned and unknown names are rejected
 */
TEST_F(LoggerTest, ParsesLevels) {
  EXPECT_OUTCOME_TRUE(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, str2lvl("warn"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(off, str2lvl("no"));
  EXPECT_EQ(off, Level::OFF);
  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
}

/**
 * @given level overrides for the building group
 * @when tuning the logging system
 * @then known groups and levels are applied and the rest is rejected
 */
TEST_F(LoggerTest, TunesGroups) {
  EXPECT_OUTCOME_TRUE_1(tuneLoggingSystem({"building=debug", "info"}));
  EXPECT_EC(tuneLoggingSystem({"no_such_group=debug"}), Error::WRONG_GROUP);
  EXPECT_EC(tuneLoggingSystem({"building=loud"}), Error::WRONG_LEVEL);
  EXPECT_EC(tuneLoggingSystem({"building"}), Error::WRONG_LEVEL);
}

/**
 * @given the blockforge groups
 * @when creating loggers in them
 * @then loggers carry the requested tag and group
 */
TEST_F(LoggerTest, CreatesLoggersInGroups) {
  auto logger = blockforge::log::createLogger("Test", "building");
  EXPECT_EQ(logger->name(), "Test");
  EXPECT_EQ(logger->group()->name(), "building");
}
