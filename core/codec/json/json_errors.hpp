/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace scv::codec::json {
  enum class JsonError {
    kParseError = 1,
    kWrongType,
    kMissingField,
    kWrongEnum,
    kOutOfRange,
  };
}  // namespace scv::codec::json

OUTCOME_HPP_DECLARE_ERROR(scv::codec::json, JsonError);
