/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/case_conv.hpp>

namespace scv::common {
  std::string hex_lower(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex0x(BytesIn bytes) {
    return "0x" + hex_lower(bytes);
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
      return UnhexError::kOddLength;
    }
    Bytes bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::hex_decode_error &) {
      return UnhexError::kNonHexInput;
    }
    return bytes;
  }

  outcome::result<Bytes> unhex0x(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
      hex.remove_prefix(2);
    }
    return unhex(hex);
  }
}  // namespace scv::common

OUTCOME_CPP_DEFINE_CATEGORY(scv::common, UnhexError, e) {
  using E = scv::common::UnhexError;
  switch (e) {
    case E::kOddLength:
      return "hex string has odd length";
    case E::kNonHexInput:
      return "hex string contains non hex characters";
  }
  return "unknown UnhexError";
}
