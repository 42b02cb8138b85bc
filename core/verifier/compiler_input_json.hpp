/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/json/json.hpp"
#include "verifier/types.hpp"

namespace scv::verifier {
  /**
   * Standard json input document, members in fixed order: language, sources,
   * settings (optimizer, metadata, outputSelection, evmVersion, libraries,
   * verbatim members)
   */
  std::string encodeCompilerInput(const CompilerInput &input);

  /**
   * Settings object alone, as reported for verified contract
   */
  std::string encodeSettings(const Settings &settings);

  codec::json::Value encodeSettings(const Settings &settings,
                                    codec::json::Allocator &allocator);

  /**
   * Parses standard json input document, settings members which are not
   * modelled are kept verbatim
   */
  outcome::result<CompilerInput> decodeCompilerInput(std::string_view json);
}  // namespace scv::verifier
