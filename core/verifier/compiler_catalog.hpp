/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include "primitives/compiler_version/compiler_version.hpp"

namespace scv::verifier {
  using primitives::CompilerVersion;

  /**
   * Read-only list of compiler versions available for verification
   */
  class CompilerCatalog {
   public:
    virtual ~CompilerCatalog() = default;

    /**
     * @return parsed version, kInvalidFormat when string is not a version,
     * kVersionNotFound when version is not available
     */
    virtual outcome::result<CompilerVersion> resolve(
        std::string_view version) const = 0;

    /**
     * Exact match, pre-release and build included
     */
    virtual bool contains(const CompilerVersion &version) const = 0;

    /**
     * @return available versions, newest first
     */
    virtual const std::vector<CompilerVersion> &versions() const = 0;
  };
}  // namespace scv::verifier
