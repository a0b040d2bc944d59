/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using singleton::log::Error;
using singleton::log::Level;
using singleton::log::parseLogFilter;
using singleton::log::str2lvl;
using singleton::log::tuneLoggingSystem;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }
};

/**
 * @given level names, including the `warning` alias
 * @when they are parsed
 * @then matching levels are returned, unknown names are rejected
 */
TEST_F(LoggerTest, ParsesLevels) {
  EXPECT_OUTCOME_TRUE(trace, str2lvl("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, str2lvl("warning"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(off, str2lvl("off"));
  EXPECT_EQ(off, Level::OFF);

  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
  EXPECT_EC(str2lvl("TRACE"), Error::WRONG_LEVEL);
}

/**
 * @given a bare level and a `group=level` filter
 * @when they are parsed
 * @then the bare level targets the node's root group
 */
TEST_F(LoggerTest, ParsesFilters) {
  EXPECT_OUTCOME_TRUE(bare, parseLogFilter("debug"));
  EXPECT_EQ(bare.group, singleton::log::defaultGroupName);
  EXPECT_EQ(bare.level, Level::DEBUG);

  EXPECT_OUTCOME_TRUE(grouped, parseLogFilter("finality=trace"));
  EXPECT_EQ(grouped.group, "finality");
  EXPECT_EQ(grouped.level, Level::TRACE);
}

/**
 * @given filters with an empty group, two separators or a bad level
 * @when they are parsed
 * @then each is rejected with its own error
 */
TEST_F(LoggerTest, RejectsMalformedFilters) {
  EXPECT_EC(parseLogFilter("=debug"), Error::MALFORMED_FILTER);
  EXPECT_EC(parseLogFilter("gossip=debug=trace"), Error::MALFORMED_FILTER);
  EXPECT_EC(parseLogFilter("gossip=chatty"), Error::WRONG_LEVEL);
  EXPECT_EC(parseLogFilter(""), Error::WRONG_LEVEL);
}

/**
 * @given configured logging system
 * @when filters naming groups of the node tree are applied
 * @then they succeed, while a group outside the tree is reported
 */
TEST_F(LoggerTest, TunesKnownGroupsOnly) {
  EXPECT_OUTCOME_TRUE_1(
      tuneLoggingSystem({"consensus=debug", "gossip=trace", "info"}));
  EXPECT_EC(tuneLoggingSystem({"babe=debug"}), Error::WRONG_GROUP);
}
