/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/solidity_client.hpp"

#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "verifier/candidate_builder.hpp"

namespace scv::verifier {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("verifier");
      return logger.get();
    }
  }  // namespace

  SolidityClient::SolidityClient(
      std::shared_ptr<CompilerCatalog> catalog,
      std::shared_ptr<CandidateVerifier> verifier,
      std::shared_ptr<eth::AddressCode> address_code,
      std::shared_ptr<Middleware> middleware)
      : catalog_{std::move(catalog)},
        resolver_{std::move(address_code)},
        orchestrator_{std::move(verifier), std::move(middleware)} {}

  outcome::result<Success> SolidityClient::verify(
      const VerificationRequest &request, const CancelFlag &cancel) const {
    const auto version_str{request.compiler_version.toString()};
    auto version{catalog_->resolve(version_str)};
    if (!version) {
      log()->info("compiler {} is not available: {}",
                  version_str,
                  version.error());
      return version.error();
    }
    if (cancel && cancel->load()) {
      return VerificationError::kCancelled;
    }
    OUTCOME_TRY(deployed, resolver_.resolve(request.contract_address));
    const auto candidates{buildCandidates(request.content)};
    log()->debug("verify {} with compiler {}, {} candidates",
                 request.contract_address,
                 version_str,
                 candidates.size());
    return orchestrator_.verify(candidates,
                                version.value(),
                                request.creation_bytecode,
                                deployed,
                                cancel);
  }
}  // namespace scv::verifier
