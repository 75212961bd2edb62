/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "net/address_validator.hpp"

#include <array>

OUTCOME_CPP_DEFINE_CATEGORY(dotquad::net, AddressError, e) {
  using dotquad::net::AddressError;
  switch (e) {
    case AddressError::INVALID_ADDRESS:
      return "invalid ipv4 address string";
  }
  return "Unknown error (error id not listed)";
}

namespace dotquad::net {

  namespace {
    using Octet = std::array<char, kMaxOctetDigits>;

    constexpr char kSeparator = '.';
    constexpr char kNoDigit = '\0';

    bool isDigit(char c) {
      return c >= '0' and c <= '9';
    }

    /// Octet must hold at least one digit and, with three digits, be <= "255"
    bool isCompleteOctet(const Octet &octet) {
      if (octet[0] == kNoDigit) {
        return false;
      }
      if (octet[2] == kNoDigit) {
        return true;
      }
      if (octet[0] > '2') {
        return false;
      }
      if (octet[0] == '2'
          and (octet[1] > '5' or (octet[1] == '5' and octet[2] > '5'))) {
        return false;
      }
      return true;
    }
  }  // namespace

  outcome::result<bool> validateIpv4(std::string_view address) {
    if (address.size() < kMinIpv4Length or address.size() > kMaxIpv4Length) {
      return AddressError::INVALID_ADDRESS;
    }

    size_t octets = 1;
    Octet octet{};
    size_t pos = 0;

    for (auto c : address) {
      if (c == kSeparator) {
        if (octets == kIpv4Octets or not isCompleteOctet(octet)) {
          return AddressError::INVALID_ADDRESS;
        }
        ++octets;
        octet.fill(kNoDigit);
        pos = 0;
        continue;
      }

      if (not isDigit(c) or pos == kMaxOctetDigits) {
        return AddressError::INVALID_ADDRESS;
      }
      octet[pos++] = c;
    }

    // last octet is not followed by a separator
    if (octets != kIpv4Octets or not isCompleteOctet(octet)) {
      return AddressError::INVALID_ADDRESS;
    }

    return true;
  }

}  // namespace dotquad::net
