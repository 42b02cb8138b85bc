/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <tuple>

#include "common/outcome.hpp"

namespace scv::primitives {
  enum class CompilerVersionError {
    kInvalidFormat = 1,
  };

  /**
   * Solidity compiler release identifier, e.g. "v0.8.2+commit.661d1103",
   * "0.8.3" or "v0.4.24-nightly.2018.4.26+commit.ef2111a2".
   */
  struct CompilerVersion {
    uint64_t major{};
    uint64_t minor{};
    uint64_t patch{};
    /** part after '-' without it, empty for releases */
    std::string pre_release;
    /** part after '+' without it, e.g. "commit.661d1103" */
    std::string build;

    static outcome::result<CompilerVersion> fromString(std::string_view str);

    /**
     * "v" prefixed long form when build is known, short form otherwise
     */
    std::string toString() const;

    /**
     * Compares only numeric part, pre-release of a version is not below it
     */
    inline bool isBelow(uint64_t major, uint64_t minor, uint64_t patch) const {
      return std::tie(this->major, this->minor, this->patch)
             < std::tie(major, minor, patch);
    }
  };

  inline bool operator==(const CompilerVersion &l, const CompilerVersion &r) {
    return std::tie(l.major, l.minor, l.patch, l.pre_release, l.build)
           == std::tie(r.major, r.minor, r.patch, r.pre_release, r.build);
  }

  inline bool operator!=(const CompilerVersion &l, const CompilerVersion &r) {
    return !(l == r);
  }

  /**
   * Numeric order, release after its pre-releases, then identifiers
   */
  bool operator<(const CompilerVersion &l, const CompilerVersion &r);
}  // namespace scv::primitives

OUTCOME_HPP_DECLARE_ERROR(scv::primitives, CompilerVersionError);
