/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include "verifier/candidate_verifier.hpp"
#include "verifier/middleware.hpp"

namespace scv::verifier {
  /**
   * Set by request owner to abandon verification, null is never set
   */
  using CancelFlag = std::shared_ptr<const std::atomic<bool>>;

  /**
   * Searches candidates and metadata variants for a compiler input whose
   * output matches deployed bytecode
   */
  class Orchestrator {
   public:
    /**
     * @param verifier - compiles and matches one input
     * @param middleware - optional post-match hook
     */
    Orchestrator(std::shared_ptr<CandidateVerifier> verifier,
                 std::shared_ptr<Middleware> middleware);

    /**
     * Tries candidates in order, each with every metadata variant of
     * compiler version in order. kNoMatchingContracts moves on to next
     * attempt, any other error stops search and is returned as is.
     * @return first match, kNoMatchingContracts when all attempts are
     * exhausted, kCancelled when cancel flag was observed
     */
    outcome::result<Success> verify(
        const std::vector<CompilerInputCandidate> &candidates,
        const CompilerVersion &compiler_version,
        const boost::optional<Bytes> &creation_bytecode,
        BytesIn deployed_bytecode,
        const CancelFlag &cancel = nullptr) const;

   private:
    /**
     * One verifier call, exception thrown by verifier is kInternal
     */
    outcome::result<Success> attempt(
        const CompilerVersion &compiler_version,
        const boost::optional<Bytes> &creation_bytecode,
        BytesIn deployed_bytecode,
        const CompilerInput &input) const;

    void notify(const Success &success) const;

    std::shared_ptr<CandidateVerifier> verifier_;
    std::shared_ptr<Middleware> middleware_;
  };
}  // namespace scv::verifier
