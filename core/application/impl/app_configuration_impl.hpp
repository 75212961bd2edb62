/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace dotquad::application {

  // clang-format off
  /**
   * Reads app configuration from multiple sources with the given priority:
   *
   *      COMMAND LINE ARGUMENTS          <- max priority
   *                V
   *        CONFIGURATION FILE
   *                V
   *          DEFAULT VALUES              <- low priority
   */
  // clang-format on

  class AppConfigurationImpl final : public AppConfiguration {
    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

   public:
    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    AppConfigurationImpl(AppConfigurationImpl &&) = delete;
    AppConfigurationImpl &operator=(AppConfigurationImpl &&) = delete;

    /**
     * @return false if help was requested or configuration is wrong
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const std::vector<std::string> &addresses() const override {
      return addresses_;
    }
    const std::optional<std::string> &inputPath() const override {
      return input_path_;
    }
    bool quiet() const override {
      return quiet_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_input_segment(const rapidjson::Value &val);
    void parse_output_segment(const rapidjson::Value &val);

    /// Accepts single string or array of strings
    static bool load_ms(const rapidjson::Value &val,
                        const char *name,
                        std::vector<std::string> &target);
    static bool load_str(const rapidjson::Value &val,
                         const char *name,
                         std::string &target);
    static bool load_bool(const rapidjson::Value &val,
                          const char *name,
                          bool &target);

    static FilePtr open_file(const std::string &filepath);

    bool read_config_from_file(const std::string &filepath);

    bool validate_config();

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general", std::bind(&AppConfigurationImpl::parse_general_segment, this, std::placeholders::_1)},
        SegmentHandler{"input",   std::bind(&AppConfigurationImpl::parse_input_segment, this, std::placeholders::_1)},
        SegmentHandler{"output",  std::bind(&AppConfigurationImpl::parse_output_segment, this, std::placeholders::_1)},
    };
    // clang-format on

    log::Logger logger_;

    std::vector<std::string> addresses_;
    std::optional<std::string> input_path_;
    bool quiet_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace dotquad::application
