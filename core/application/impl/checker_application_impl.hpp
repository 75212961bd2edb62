/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/checker_application.hpp"

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string_view>

#include "application/app_configuration.hpp"
#include "log/logger.hpp"

namespace dotquad::application {

  struct CheckSummary {
    size_t checked = 0;
    size_t valid = 0;
    size_t invalid = 0;
  };

  class CheckerApplicationImpl final : public CheckerApplication {
   public:
    /**
     * @param in stream used when input path is `-`
     * @param out stream verdicts are printed to
     */
    CheckerApplicationImpl(std::shared_ptr<const AppConfiguration> config,
                           std::istream &in,
                           std::ostream &out);

    int run() override;

    const CheckSummary &summary() const {
      return summary_;
    }

   private:
    void check(std::string_view address);

    /// Checks every non-empty line of the stream
    void checkLines(std::istream &in);

    std::shared_ptr<const AppConfiguration> config_;
    std::istream &in_;
    std::ostream &out_;
    log::Logger logger_;
    CheckSummary summary_;
  };

}  // namespace dotquad::application
