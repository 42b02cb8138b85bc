/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/impl/logging_middleware.hpp"

#include "common/logger.hpp"

namespace scv::verifier {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("verified");
      return logger.get();
    }
  }  // namespace

  outcome::result<void> LoggingMiddleware::call(const Success &success) {
    log()->info("{}:{} verified, compiler {}, metadata {}, match {}",
                success.file_name,
                success.contract_name,
                success.compiler_version.toString(),
                success.metadata_variant
                    ? common::to_string(*success.metadata_variant).value()
                    : "default",
                common::to_string(success.match_type).value());
    return outcome::success();
  }
}  // namespace scv::verifier
