/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(scv::codec::json, JsonError, e) {
  using E = scv::codec::json::JsonError;
  switch (e) {
    case E::kParseError:
      return "invalid json";
    case E::kWrongType:
      return "wrong type";
    case E::kMissingField:
      return "missing field";
    case E::kWrongEnum:
      return "wrong enum";
    case E::kOutOfRange:
      return "out of range";
  }

  return "unknown JsonError error code";
}
