/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/evm_version/evm_version.hpp"

namespace scv::primitives {
  outcome::result<EvmVersion> evmVersionFromString(std::string_view str) {
    if (auto version{common::from_string<EvmVersion>(str)}) {
      return *version;
    }
    return EvmVersionError::kUnknownEvmVersion;
  }

  std::string_view toString(EvmVersion version) {
    // every enumerator is present in conversion table
    return common::to_string(version).value();
  }
}  // namespace scv::primitives

OUTCOME_CPP_DEFINE_CATEGORY(scv::primitives, EvmVersionError, e) {
  using E = scv::primitives::EvmVersionError;
  switch (e) {
    case E::kUnknownEvmVersion:
      return "EvmVersion: unknown evm version";
  }
  return "EvmVersion: unknown error";
}
