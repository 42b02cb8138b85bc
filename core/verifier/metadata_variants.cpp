/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/metadata_variants.hpp"

#include <array>

namespace scv::verifier {
  namespace {
    // ordered by probability of occurrence
    constexpr std::array kBytecodeHashes{
        BytecodeHash::kIpfs, BytecodeHash::kNone, BytecodeHash::kBzzr1};
  }  // namespace

  std::vector<MetadataVariant> metadataVariants(
      const CompilerVersion &version) {
    if (version.isBelow(0, 6, 0)) {
      return {boost::none};
    }
    return std::vector<MetadataVariant>(kBytecodeHashes.begin(),
                                        kBytecodeHashes.end());
  }

  CompilerInput withMetadataVariant(CompilerInput input,
                                    const MetadataVariant &variant) {
    if (variant) {
      if (!input.settings.metadata) {
        input.settings.metadata.emplace();
      }
      input.settings.metadata->bytecode_hash = *variant;
    }
    return input;
  }
}  // namespace scv::verifier
