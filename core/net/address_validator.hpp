/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string_view>

#include "outcome/outcome.hpp"

namespace dotquad::net {

  /**
   * @brief error codes of address validation
   */
  enum class AddressError {
    INVALID_ADDRESS = 1,
  };
}  // namespace dotquad::net

OUTCOME_HPP_DECLARE_ERROR(dotquad::net, AddressError);

namespace dotquad::net {

  /// Shortest dotted-decimal address: "1.1.1.1"
  constexpr size_t kMinIpv4Length = 7;
  /// Longest dotted-decimal address: "255.255.255.255"
  constexpr size_t kMaxIpv4Length = 15;

  constexpr size_t kIpv4Octets = 4;
  constexpr size_t kMaxOctetDigits = 3;

  /**
   * @brief Checks that string is an RFC 791 IPv4 address in dotted-decimal
   * notation. The string is scanned once, no integer parsing is done.
   * @param address candidate address, taken as is (no trimming)
   * @return true if address is valid, AddressError::INVALID_ADDRESS otherwise
   *
   * @note octets with leading zeros ("010") are read as decimal
   */
  outcome::result<bool> validateIpv4(std::string_view address);

}  // namespace dotquad::net
