/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>

namespace dotquad::application {

  /**
   * @class CheckerApplication validates configured addresses and reports
   * verdicts
   */
  class CheckerApplication {
   public:
    static constexpr int kAllValid = EXIT_SUCCESS;
    static constexpr int kSomeInvalid = 1;
    static constexpr int kUsageError = 2;

    virtual ~CheckerApplication() = default;

    /**
     * Checks all addresses
     * @return process exit code: kAllValid, kSomeInvalid or kUsageError
     */
    virtual int run() = 0;
  };

}  // namespace dotquad::application
