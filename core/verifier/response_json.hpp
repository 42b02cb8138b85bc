/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "verifier/types.hpp"

namespace scv::verifier {
  /** verification response status of verified contract */
  constexpr std::string_view kStatusOk{"0"};
  /** verification response status of rejected input */
  constexpr std::string_view kStatusFailed{"1"};

  /**
   * {"message": "OK", "status": "0", "result": {...}}, result describes
   * verified contract: names, compiler version, sources, evm version,
   * optimizer, libraries, effective compiler settings, constructor
   * arguments, abi, local bytecode parts and match type
   */
  std::string encodeSuccess(const Success &success);

  /**
   * {"message": error message, "status": "1", "result": null}
   */
  std::string encodeFailure(const std::error_code &error);

  /**
   * {"versions": [...]}
   */
  std::string encodeVersions(const std::vector<CompilerVersion> &versions);
}  // namespace scv::verifier
