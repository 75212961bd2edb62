/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using dotquad::log::Error;
using dotquad::log::Level;
using dotquad::log::str2lvl;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void TearDown() override {
    dotquad::log::setLevelOfGroup("application", Level::INFO);
    dotquad::log::setLevelOfGroup(dotquad::log::defaultGroupName,
                                  Level::INFO);
  }
};

/**
 * @given level names and their aliases
 * @when parse them
 * @then corresponding levels are returned
 */
TEST_F(LoggerTest, LevelNames) {
  std::vector<std::pair<std::string, Level>> cases{
      {"trace", Level::TRACE},
      {"debug", Level::DEBUG},
      {"verbose", Level::VERBOSE},
      {"info", Level::INFO},
      {"inf", Level::INFO},
      {"warning", Level::WARN},
      {"warn", Level::WARN},
      {"error", Level::ERROR},
      {"err", Level::ERROR},
      {"critical", Level::CRITICAL},
      {"crit", Level::CRITICAL},
      {"off", Level::OFF},
      {"no", Level::OFF},
  };
  for (auto &[name, expected] : cases) {
    EXPECT_OUTCOME_TRUE(level, str2lvl(name));
    EXPECT_EQ(level, expected) << name;
  }
}

/**
 * @given unknown level name
 * @when parse it
 * @then WRONG_LEVEL error is returned
 */
TEST_F(LoggerTest, UnknownLevel) {
  EXPECT_EC(str2lvl("loud"), Error::WRONG_LEVEL);
  EXPECT_EC(str2lvl("INFO"), Error::WRONG_LEVEL);
  EXPECT_EC(str2lvl(""), Error::WRONG_LEVEL);
}

/**
 * @given logger of application group
 * @when group level is tuned with `<group>=<level>` chunk
 * @then logger follows the group level
 */
TEST_F(LoggerTest, TuneGroupLevel) {
  auto logger = dotquad::log::createLogger("TuneTest", "application");
  dotquad::log::tuneLoggingSystem({"application=trace"});
  EXPECT_EQ(logger->level(), Level::TRACE);

  dotquad::log::tuneLoggingSystem({"application=error"});
  EXPECT_EQ(logger->level(), Level::ERROR);
}

/**
 * @given malformed tuning chunks
 * @when apply them
 * @then they are skipped and level stays unchanged
 */
TEST_F(LoggerTest, TuneSkipsMalformedChunks) {
  auto logger = dotquad::log::createLogger("TuneTest", "application");
  dotquad::log::tuneLoggingSystem({"application=debug"});
  dotquad::log::tuneLoggingSystem(
      {"application=loud", "nonexistent=trace", "application"});
  EXPECT_EQ(logger->level(), Level::DEBUG);
}
