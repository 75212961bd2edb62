/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>

#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/checker_application_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using dotquad::application::AppConfigurationImpl;
using dotquad::application::CheckerApplication;
using dotquad::application::CheckerApplicationImpl;

namespace {
  int run_checker(int argc, const char **argv) {
    auto configuration = std::make_shared<AppConfigurationImpl>(
        dotquad::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return CheckerApplication::kUsageError;
    }

    dotquad::log::tuneLoggingSystem(configuration->log());

    auto app = std::make_shared<CheckerApplicationImpl>(
        configuration, std::cin, std::cout);
    return app->run();
  }
}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  // Logging system
  auto logging_system = [&]() -> std::shared_ptr<soralog::LoggingSystem> {
    auto custom_log_config_path =
        dotquad::log::Configurator::getLogConfigFile(argc, argv);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        return nullptr;
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto dotquad_log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<dotquad::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<dotquad::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(dotquad_log_configurator));
  }();
  if (not logging_system) {
    return CheckerApplication::kUsageError;
  }

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    std::cerr << r.message << '\n';
  }
  if (r.has_error) {
    return CheckerApplication::kUsageError;
  }

  dotquad::log::setLoggingSystem(logging_system);

  auto exit_code = run_checker(argc, argv);

  auto logger =
      dotquad::log::createLogger("Main", dotquad::log::defaultGroupName);
  SL_DEBUG(logger, "Exit with code {}", exit_code);
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
