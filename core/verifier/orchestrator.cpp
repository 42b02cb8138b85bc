/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/orchestrator.hpp"

#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "verifier/metadata_variants.hpp"

namespace scv::verifier {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("verifier");
      return logger.get();
    }

    bool isCancelled(const CancelFlag &cancel) {
      return cancel && cancel->load();
    }

    std::string_view variantName(const MetadataVariant &variant) {
      return variant ? common::to_string(*variant).value() : "default";
    }
  }  // namespace

  Orchestrator::Orchestrator(std::shared_ptr<CandidateVerifier> verifier,
                             std::shared_ptr<Middleware> middleware)
      : verifier_{std::move(verifier)}, middleware_{std::move(middleware)} {}

  outcome::result<Success> Orchestrator::verify(
      const std::vector<CompilerInputCandidate> &candidates,
      const CompilerVersion &compiler_version,
      const boost::optional<Bytes> &creation_bytecode,
      BytesIn deployed_bytecode,
      const CancelFlag &cancel) const {
    const auto variants{metadataVariants(compiler_version)};
    const std::vector<MetadataVariant> as_is{boost::none};

    for (size_t index{0}; index < candidates.size(); ++index) {
      const auto &candidate{candidates[index]};
      for (const auto &variant :
           candidate.metadata_pinned ? as_is : variants) {
        if (isCancelled(cancel)) {
          return VerificationError::kCancelled;
        }
        const auto input{withMetadataVariant(candidate.input, variant)};
        log()->debug("attempt candidate {} ({}), metadata {}",
                     index,
                     common::to_string(input.language).value(),
                     variantName(variant));

        auto result{attempt(
            compiler_version, creation_bytecode, deployed_bytecode, input)};
        if (isCancelled(cancel)) {
          // result of attempt started before cancellation is dropped
          return VerificationError::kCancelled;
        }
        if (!result) {
          if (result.error() == VerificationError::kNoMatchingContracts) {
            continue;
          }
          log()->info("verification stopped at candidate {}: {}",
                      index,
                      result.error());
          return result.error();
        }

        auto success{std::move(result.value())};
        success.compiler_input = input;
        success.candidate_index = index;
        success.metadata_variant = input.settings.metadata
                                       ? input.settings.metadata->bytecode_hash
                                       : boost::none;
        log()->info("contract {} verified with candidate {}, metadata {}",
                    success.contract_name,
                    index,
                    variantName(success.metadata_variant));
        notify(success);
        return success;
      }
    }

    return VerificationError::kNoMatchingContracts;
  }

  outcome::result<Success> Orchestrator::attempt(
      const CompilerVersion &compiler_version,
      const boost::optional<Bytes> &creation_bytecode,
      BytesIn deployed_bytecode,
      const CompilerInput &input) const {
    try {
      return verifier_->verify(
          compiler_version, creation_bytecode, deployed_bytecode, input);
    } catch (const std::exception &e) {
      log()->error("verifier thrown: {}", e.what());
    } catch (...) {
      log()->error("verifier thrown unknown exception");
    }
    return VerificationError::kInternal;
  }

  void Orchestrator::notify(const Success &success) const {
    if (!middleware_) {
      return;
    }
    try {
      auto result{middleware_->call(success)};
      if (!result) {
        log()->warn("post-match hook failed: {}", result.error());
      }
    } catch (const std::exception &e) {
      log()->warn("post-match hook thrown: {}", e.what());
    } catch (...) {
      log()->warn("post-match hook thrown unknown exception");
    }
  }
}  // namespace scv::verifier
