/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "verifier/types.hpp"

namespace scv::verifier {
  /**
   * Outputs every candidate requests: abi, both bytecodes and method
   * identifiers of all contracts, ast of all files
   */
  OutputSelection defaultOutputSelection();

  /**
   * Dialect by file extension, ".yul" files are Yul, all others Solidity
   */
  SourceLanguage sourceLanguage(const std::string &path);

  /**
   * One candidate per dialect present, Solidity before Yul. Libraries are
   * attached to every file because the declaring file is unknown.
   */
  std::vector<CompilerInputCandidate> buildCandidates(
      const MultiFileContent &content);

  /**
   * Single candidate carrying input as is
   */
  std::vector<CompilerInputCandidate> buildCandidates(
      const StandardJsonContent &content);

  std::vector<CompilerInputCandidate> buildCandidates(
      const VerificationContent &content);
}  // namespace scv::verifier
