/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "verifier/middleware.hpp"

namespace scv::verifier {
  /**
   * Reports every verified contract to log
   */
  class LoggingMiddleware : public Middleware {
   public:
    outcome::result<void> call(const Success &success) override;
  };
}  // namespace scv::verifier
