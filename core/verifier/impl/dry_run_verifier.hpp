/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>

#include "verifier/candidate_verifier.hpp"

namespace scv::verifier {
  /**
   * Compiles nothing. Records every compiler input offered and reports no
   * match, so orchestrator walks whole search.
   */
  class DryRunVerifier : public CandidateVerifier {
   public:
    outcome::result<Success> verify(
        const CompilerVersion &compiler_version,
        const boost::optional<Bytes> &creation_bytecode,
        BytesIn deployed_bytecode,
        const CompilerInput &compiler_input) const override;

    /**
     * @return compiler inputs in order they were offered
     */
    std::vector<CompilerInput> attempts() const;

   private:
    mutable std::mutex mutex_;
    mutable std::vector<CompilerInput> attempts_;
  };
}  // namespace scv::verifier
