/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/enum.hpp"
#include "common/outcome.hpp"

namespace scv::primitives {
  /**
   * Hard fork the compiler generates code for
   */
  enum class EvmVersion {
    kHomestead,
    kTangerineWhistle,
    kSpuriousDragon,
    kByzantium,
    kConstantinople,
    kPetersburg,
    kIstanbul,
    kBerlin,
    kLondon,
    kParis,
    kShanghai,
    kCancun,
  };

  inline auto &class_conversion_table(EvmVersion &&) {
    using E = EvmVersion;
    static common::ConversionTable<E, 12> table{{
        {E::kHomestead, "homestead"},
        {E::kTangerineWhistle, "tangerineWhistle"},
        {E::kSpuriousDragon, "spuriousDragon"},
        {E::kByzantium, "byzantium"},
        {E::kConstantinople, "constantinople"},
        {E::kPetersburg, "petersburg"},
        {E::kIstanbul, "istanbul"},
        {E::kBerlin, "berlin"},
        {E::kLondon, "london"},
        {E::kParis, "paris"},
        {E::kShanghai, "shanghai"},
        {E::kCancun, "cancun"},
    }};
    return table;
  }

  enum class EvmVersionError {
    kUnknownEvmVersion = 1,
  };

  /**
   * Parses compiler spelling of hard fork name, e.g. "spuriousDragon"
   */
  outcome::result<EvmVersion> evmVersionFromString(std::string_view str);

  std::string_view toString(EvmVersion version);
}  // namespace scv::primitives

OUTCOME_HPP_DECLARE_ERROR(scv::primitives, EvmVersionError);
