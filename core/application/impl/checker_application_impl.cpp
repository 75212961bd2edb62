/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/checker_application_impl.hpp"

#include <fstream>
#include <string>

#include <boost/assert.hpp>

#include "net/address_validator.hpp"

namespace dotquad::application {

  CheckerApplicationImpl::CheckerApplicationImpl(
      std::shared_ptr<const AppConfiguration> config,
      std::istream &in,
      std::ostream &out)
      : config_(std::move(config)),
        in_(in),
        out_(out),
        logger_(log::createLogger("Checker", "application")) {
    BOOST_ASSERT(config_ != nullptr);
  }

  int CheckerApplicationImpl::run() {
    summary_ = {};

    for (auto &address : config_->addresses()) {
      check(address);
    }

    if (auto &path = config_->inputPath(); path.has_value()) {
      if (*path == AppConfiguration::kStdinPath) {
        SL_DEBUG(logger_, "Reading addresses from standard input");
        checkLines(in_);
      } else {
        std::ifstream file(*path);
        if (not file.is_open()) {
          SL_ERROR(logger_, "Can't open input file {}", *path);
          return kUsageError;
        }
        SL_DEBUG(logger_, "Reading addresses from {}", *path);
        checkLines(file);
      }
    }

    SL_INFO(logger_,
            "Checked {} address(es): {} valid, {} invalid",
            summary_.checked,
            summary_.valid,
            summary_.invalid);

    return summary_.invalid == 0 ? kAllValid : kSomeInvalid;
  }

  void CheckerApplicationImpl::checkLines(std::istream &in) {
    std::string line;
    while (std::getline(in, line)) {
      if (not line.empty() and line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) {
        continue;
      }
      check(line);
    }
  }

  void CheckerApplicationImpl::check(std::string_view address) {
    ++summary_.checked;

    auto res = net::validateIpv4(address);
    if (res.has_value()) {
      ++summary_.valid;
      SL_TRACE(logger_, "Address '{}' is valid", address);
      if (not config_->quiet()) {
        out_ << address << ": valid\n";
      }
      return;
    }

    ++summary_.invalid;
    auto message = res.error().message();
    SL_DEBUG(logger_, "Address '{}' rejected: {}", address, message);
    if (not config_->quiet()) {
      out_ << address << ": " << message << '\n';
    }
  }

}  // namespace dotquad::application
