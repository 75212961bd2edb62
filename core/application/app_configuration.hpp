/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dotquad::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    /// Input path which stands for standard input
    static constexpr const char *kStdinPath = "-";

    virtual ~AppConfiguration() = default;

    /**
     * @return addresses to check, given explicitly (command line or config
     * file)
     */
    virtual const std::vector<std::string> &addresses() const = 0;

    /**
     * @return path to file with one address per line, `-` for stdin
     */
    virtual const std::optional<std::string> &inputPath() const = 0;

    /**
     * @return true if verdict for each address must not be printed
     */
    virtual bool quiet() const = 0;

    /**
     * @return logging tuning chunks, `<level>` or `<group>=<level>`
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace dotquad::application
