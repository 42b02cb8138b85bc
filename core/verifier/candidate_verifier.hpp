/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "verifier/types.hpp"
#include "verifier/verification_error.hpp"

namespace scv::verifier {
  /**
   * Compiles one compiler input and compares its contracts with deployed
   * bytecode. Errors are VerificationError values. Called concurrently with
   * different inputs, keeps no references to arguments after return.
   */
  class CandidateVerifier {
   public:
    virtual ~CandidateVerifier() = default;

    /**
     * @param compiler_version - compiler to run
     * @param creation_bytecode - compared too when present
     * @param deployed_bytecode - code at contract address
     * @param compiler_input - candidate with metadata variant applied
     * @return matched contract, kNoMatchingContracts when compiled output
     * has no equivalent contract
     */
    virtual outcome::result<Success> verify(
        const CompilerVersion &compiler_version,
        const boost::optional<Bytes> &creation_bytecode,
        BytesIn deployed_bytecode,
        const CompilerInput &compiler_input) const = 0;
  };
}  // namespace scv::verifier
