/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/checker_application_impl.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/application/app_configuration_mock.hpp"
#include "testutil/prepare_loggers.hpp"

using dotquad::application::AppConfiguration;
using dotquad::application::AppConfigurationMock;
using dotquad::application::CheckerApplication;
using dotquad::application::CheckerApplicationImpl;
using testing::Return;
using testing::ReturnRef;

class CheckerApplicationTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    config_ = std::make_shared<AppConfigurationMock>();
    EXPECT_CALL(*config_, addresses()).WillRepeatedly(ReturnRef(addresses_));
    EXPECT_CALL(*config_, inputPath()).WillRepeatedly(ReturnRef(input_path_));
    EXPECT_CALL(*config_, quiet()).WillRepeatedly(Return(false));
  }

  void TearDown() override {
    if (not input_file_.empty()) {
      std::filesystem::remove(input_file_);
    }
  }

  std::string createInputFile(const std::string &content) {
    input_file_ =
        (std::filesystem::temp_directory_path()
         / ("dotquad_input_" + std::to_string(std::random_device{}())))
            .native();
    std::ofstream file(input_file_, std::ofstream::out | std::ofstream::trunc);
    file << content;
    return input_file_;
  }

  std::unique_ptr<CheckerApplicationImpl> createApp() {
    return std::make_unique<CheckerApplicationImpl>(config_, in_, out_);
  }

  std::vector<std::string> addresses_;
  std::optional<std::string> input_path_;
  std::string input_file_;
  std::istringstream in_;
  std::ostringstream out_;
  std::shared_ptr<AppConfigurationMock> config_;
};

/**
 * @given valid addresses only
 * @when run application
 * @then every address is reported valid and exit code is kAllValid
 */
TEST_F(CheckerApplicationTest, AllValid) {
  addresses_ = {"1.1.1.1", "255.255.255.255"};
  auto app = createApp();

  ASSERT_EQ(app->run(), CheckerApplication::kAllValid);
  EXPECT_EQ(out_.str(), "1.1.1.1: valid\n255.255.255.255: valid\n");
  EXPECT_EQ(app->summary().checked, 2u);
  EXPECT_EQ(app->summary().valid, 2u);
  EXPECT_EQ(app->summary().invalid, 0u);
}

/**
 * @given valid and invalid addresses
 * @when run application
 * @then invalid address is reported with error message and exit code is
 * kSomeInvalid
 */
TEST_F(CheckerApplicationTest, SomeInvalid) {
  addresses_ = {"10.0.0.1", "10.256.0.1", "215.0"};
  auto app = createApp();

  ASSERT_EQ(app->run(), CheckerApplication::kSomeInvalid);
  EXPECT_EQ(out_.str(),
            "10.0.0.1: valid\n"
            "10.256.0.1: invalid ipv4 address string\n"
            "215.0: invalid ipv4 address string\n");
  EXPECT_EQ(app->summary().valid, 1u);
  EXPECT_EQ(app->summary().invalid, 2u);
}

/**
 * @given quiet configuration
 * @when run application
 * @then nothing is printed, exit code still reports the result
 */
TEST_F(CheckerApplicationTest, Quiet) {
  addresses_ = {"10.0.0.1", "10.358.0.1"};
  EXPECT_CALL(*config_, quiet()).WillRepeatedly(Return(true));
  auto app = createApp();

  ASSERT_EQ(app->run(), CheckerApplication::kSomeInvalid);
  EXPECT_TRUE(out_.str().empty());
}

/**
 * @given input path `-` and addresses on standard input
 * @when run application
 * @then explicit addresses are checked first, then every non-empty line
 */
TEST_F(CheckerApplicationTest, ReadsStdin) {
  addresses_ = {"127.0.0.1"};
  input_path_ = AppConfiguration::kStdinPath;
  in_.str("192.168.0.9\n\n2.255.99.254\r\n.10.256.0.9\n");
  auto app = createApp();

  ASSERT_EQ(app->run(), CheckerApplication::kSomeInvalid);
  EXPECT_EQ(out_.str(),
            "127.0.0.1: valid\n"
            "192.168.0.9: valid\n"
            "2.255.99.254: valid\n"
            ".10.256.0.9: invalid ipv4 address string\n");
  EXPECT_EQ(app->summary().checked, 4u);
}

/**
 * @given input file with addresses
 * @when run application
 * @then addresses of the file are checked
 */
TEST_F(CheckerApplicationTest, ReadsFile) {
  input_path_ = createInputFile("10.0.0.1\n8.8.4.4");
  auto app = createApp();

  ASSERT_EQ(app->run(), CheckerApplication::kAllValid);
  EXPECT_EQ(out_.str(), "10.0.0.1: valid\n8.8.4.4: valid\n");
}

/**
 * @given path to nonexistent input file
 * @when run application
 * @then exit code is kUsageError
 */
TEST_F(CheckerApplicationTest, MissingFile) {
  input_path_ = (std::filesystem::temp_directory_path()
                 / "dotquad_surely_missing_input.txt")
                    .native();
  auto app = createApp();

  ASSERT_EQ(app->run(), CheckerApplication::kUsageError);
}

/**
 * @given application already run once
 * @when run it again
 * @then summary is collected anew
 */
TEST_F(CheckerApplicationTest, RunTwice) {
  addresses_ = {"1.2.3.4"};
  auto app = createApp();

  ASSERT_EQ(app->run(), CheckerApplication::kAllValid);
  ASSERT_EQ(app->run(), CheckerApplication::kAllValid);
  EXPECT_EQ(app->summary().checked, 1u);
}
