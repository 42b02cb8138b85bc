/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "verifier/types.hpp"

namespace scv::verifier {
  enum class RequestError {
    kInvalidJson = 1,
    kMissingField,
    kInvalidField,
    kInvalidCreationBytecode,
    kInvalidCompilerVersion,
    kInvalidEvmVersion,
    kInvalidContent,
  };

  /**
   * Decodes request carrying loose source files:
   * {"contract_address", "creation_bytecode"?, "compiler_version",
   *  "sources": {path: text}, "evm_version"?, "optimization_runs"?,
   *  "contract_libraries"?: {name: address}}.
   * Missing or "default" evm version means compiler default.
   */
  outcome::result<VerificationRequest> decodeMultiPartRequest(
      std::string_view json);

  /**
   * Decodes request carrying standard json compiler input as string member
   * "input", other members are same as in multi-part request
   */
  outcome::result<VerificationRequest> decodeStandardJsonRequest(
      std::string_view json);
}  // namespace scv::verifier

OUTCOME_HPP_DECLARE_ERROR(scv::verifier, RequestError);
