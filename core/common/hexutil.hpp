/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace scv::common {
  enum class UnhexError {
    kOddLength = 1,
    kNonHexInput,
  };

  /**
   * Encodes bytes as lowercase hex without prefix
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * Encodes bytes as lowercase hex with "0x" prefix
   */
  std::string hex0x(BytesIn bytes);

  /**
   * Decodes hex string without prefix
   * @param hex - even length string of hex digits, any case
   */
  outcome::result<Bytes> unhex(std::string_view hex);

  /**
   * Decodes hex string, "0x" or "0X" prefix is optional
   */
  outcome::result<Bytes> unhex0x(std::string_view hex);
}  // namespace scv::common

OUTCOME_HPP_DECLARE_ERROR(scv::common, UnhexError);
