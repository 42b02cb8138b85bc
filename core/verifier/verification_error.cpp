/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/verification_error.hpp"

#include "primitives/compiler_version/compiler_version.hpp"
#include "verifier/request_json.hpp"

namespace scv::verifier {
  ErrorClass classifyError(const std::error_code &error) {
    using E = VerificationError;
    if (error.category() == make_error_code(E{}).category()) {
      switch (static_cast<E>(error.value())) {
        case E::kCompilation:
        case E::kNoMatchingContracts:
        case E::kCompilerVersionMismatch:
          return ErrorClass::kUserInput;
        case E::kInitialization:
        case E::kVersionNotFound:
        case E::kNoDeployedCode:
          return ErrorClass::kClient;
        case E::kResolverUnavailable:
        case E::kCancelled:
          return ErrorClass::kRetryable;
        case E::kInternal:
          return ErrorClass::kServer;
      }
      return ErrorClass::kServer;
    }
    if (error.category() == make_error_code(RequestError{}).category()
        || error.category()
               == make_error_code(primitives::CompilerVersionError{})
                      .category()) {
      return ErrorClass::kClient;
    }
    return ErrorClass::kServer;
  }
}  // namespace scv::verifier

OUTCOME_CPP_DEFINE_CATEGORY(scv::verifier, VerificationError, e) {
  using E = scv::verifier::VerificationError;
  switch (e) {
    case E::kCompilation:
      return "Verification: compilation failed";
    case E::kNoMatchingContracts:
      return "Verification: no contract could be verified with provided data";
    case E::kCompilerVersionMismatch:
      return "Verification: compiler version mismatch";
    case E::kInitialization:
      return "Verification: verifier could not be initialized";
    case E::kVersionNotFound:
      return "Verification: compiler version not found";
    case E::kInternal:
      return "Verification: internal error";
    case E::kNoDeployedCode:
      return "Verification: no contract deployed at address";
    case E::kResolverUnavailable:
      return "Verification: deployed bytecode could not be fetched";
    case E::kCancelled:
      return "Verification: cancelled";
  }
  return "Verification: unknown error";
}
