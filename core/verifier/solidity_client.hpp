/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "eth/address_code.hpp"
#include "verifier/bytecode_resolver.hpp"
#include "verifier/compiler_catalog.hpp"
#include "verifier/orchestrator.hpp"

namespace scv::verifier {
  /**
   * Verifies requests against deployed contracts. Holds only collaborators
   * which are safe for concurrent use, so one client serves all requests.
   */
  class SolidityClient {
   public:
    SolidityClient(std::shared_ptr<CompilerCatalog> catalog,
                   std::shared_ptr<CandidateVerifier> verifier,
                   std::shared_ptr<eth::AddressCode> address_code,
                   std::shared_ptr<Middleware> middleware = nullptr);

    /**
     * Checks compiler version is available, fetches deployed bytecode,
     * builds candidates of request content and searches them
     * @return verified contract or error of first step which failed
     */
    outcome::result<Success> verify(const VerificationRequest &request,
                                    const CancelFlag &cancel = nullptr) const;

   private:
    std::shared_ptr<CompilerCatalog> catalog_;
    DeployedBytecodeResolver resolver_;
    Orchestrator orchestrator_;
  };
}  // namespace scv::verifier
