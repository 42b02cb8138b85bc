/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace scv::verifier {
  /**
   * Outcome of a verification attempt that is not a match
   */
  enum class VerificationError {
    /** source does not compile under attempted settings */
    kCompilation = 1,
    /** compiled, but no contract bytecode equals deployed one */
    kNoMatchingContracts,
    /** declared compiler version disagrees with bytecode markers */
    kCompilerVersionMismatch,
    /** compiler invocation could not be set up */
    kInitialization,
    /** compiler version is not in catalog */
    kVersionNotFound,
    /** failure not attributable to request */
    kInternal,
    /** no code is deployed at address */
    kNoDeployedCode,
    /** address code could not be fetched, transient */
    kResolverUnavailable,
    /** request context was cancelled before verification finished */
    kCancelled,
  };

  /**
   * How caller should present an error
   */
  enum class ErrorClass {
    /** input was wrong, response explains why */
    kUserInput,
    /** request could not be attempted because of its parameters */
    kClient,
    /** same request may succeed later */
    kRetryable,
    /** server side failure */
    kServer,
  };

  ErrorClass classifyError(const std::error_code &error);

  /**
   * Verification was attempted and input was found wrong
   */
  inline bool isUserFacing(const std::error_code &error) {
    return classifyError(error) == ErrorClass::kUserInput;
  }
}  // namespace scv::verifier

OUTCOME_HPP_DECLARE_ERROR(scv::verifier, VerificationError);
