/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/bytecode_resolver.hpp"

#include <boost/algorithm/string/case_conv.hpp>

#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "verifier/verification_error.hpp"

namespace scv::verifier {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("resolver");
      return logger.get();
    }
  }  // namespace

  DeployedBytecodeResolver::DeployedBytecodeResolver(
      std::shared_ptr<eth::AddressCode> address_code)
      : address_code_{std::move(address_code)} {}

  outcome::result<Bytes> DeployedBytecodeResolver::resolve(
      const std::string &address) const {
    const auto lower{boost::algorithm::to_lower_copy(address)};
    auto code{address_code_->codeAt(lower)};
    if (!code) {
      log()->error("code at {} is unavailable: {}", lower, code.error());
      return VerificationError::kResolverUnavailable;
    }
    if (!code.value() || code.value()->empty()) {
      log()->info("no contract deployed at {}", lower);
      return VerificationError::kNoDeployedCode;
    }
    log()->debug("code at {}: {} bytes", lower, code.value()->size());
    return std::move(*code.value());
  }
}  // namespace scv::verifier
