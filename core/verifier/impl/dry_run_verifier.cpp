/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/impl/dry_run_verifier.hpp"

#include "common/logger.hpp"
#include "verifier/compiler_input_json.hpp"

namespace scv::verifier {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("verifier");
      return logger.get();
    }
  }  // namespace

  outcome::result<Success> DryRunVerifier::verify(
      const CompilerVersion &compiler_version,
      const boost::optional<Bytes> &creation_bytecode,
      BytesIn deployed_bytecode,
      const CompilerInput &compiler_input) const {
    log()->debug("dry run {}, deployed {} bytes, creation {}: {}",
                 compiler_version.toString(),
                 deployed_bytecode.size(),
                 creation_bytecode ? "given" : "none",
                 encodeCompilerInput(compiler_input));
    std::lock_guard lock{mutex_};
    attempts_.push_back(compiler_input);
    return VerificationError::kNoMatchingContracts;
  }

  std::vector<CompilerInput> DryRunVerifier::attempts() const {
    std::lock_guard lock{mutex_};
    return attempts_;
  }
}  // namespace scv::verifier
