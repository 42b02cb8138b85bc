/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "verifier/types.hpp"

namespace scv::verifier {
  /**
   * Post-match hook, runs for every successful verification before result is
   * returned. Its failures never change verification result.
   */
  class Middleware {
   public:
    virtual ~Middleware() = default;

    virtual outcome::result<void> call(const Success &success) = 0;
  };
}  // namespace scv::verifier
