/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "verifier/types.hpp"

namespace scv::verifier {
  /**
   * Metadata hash choices to try for compiler version, most frequent first.
   * Compilers before 0.6.0 can not select hash, so the only variant leaves
   * settings unchanged.
   */
  std::vector<MetadataVariant> metadataVariants(const CompilerVersion &version);

  /**
   * Copy of input with variant active, other metadata settings are kept
   */
  CompilerInput withMetadataVariant(CompilerInput input,
                                    const MetadataVariant &variant);
}  // namespace scv::verifier
