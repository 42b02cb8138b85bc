/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/candidate_builder.hpp"

#include <boost/filesystem/path.hpp>

namespace scv::verifier {
  OutputSelection defaultOutputSelection() {
    return {{"*",
             {{"", {"ast"}},
              {"*",
               {"abi",
                "evm.bytecode",
                "evm.deployedBytecode",
                "evm.methodIdentifiers"}}}}};
  }

  SourceLanguage sourceLanguage(const std::string &path) {
    if (boost::filesystem::path{path}.extension() == ".yul") {
      return SourceLanguage::kYul;
    }
    return SourceLanguage::kSolidity;
  }

  std::vector<CompilerInputCandidate> buildCandidates(
      const MultiFileContent &content) {
    Settings settings;
    settings.optimizer.enabled = content.optimization_runs.has_value();
    settings.optimizer.runs = content.optimization_runs;
    settings.output_selection = defaultOutputSelection();
    settings.evm_version = content.evm_version;
    if (content.contract_libraries) {
      for (const auto &source : content.sources) {
        settings.libraries.emplace(source.first, *content.contract_libraries);
      }
    }

    Sources solidity;
    Sources yul;
    for (const auto &source : content.sources) {
      auto &sources{sourceLanguage(source.first) == SourceLanguage::kYul
                        ? yul
                        : solidity};
      sources.emplace(source);
    }

    std::vector<CompilerInputCandidate> candidates;
    if (!solidity.empty()) {
      candidates.push_back(
          {{SourceLanguage::kSolidity, std::move(solidity), settings}});
    }
    if (!yul.empty()) {
      candidates.push_back({{SourceLanguage::kYul, std::move(yul), settings}});
    }
    return candidates;
  }

  std::vector<CompilerInputCandidate> buildCandidates(
      const StandardJsonContent &content) {
    const auto &metadata{content.input.settings.metadata};
    return {{content.input, metadata && metadata->bytecode_hash.has_value()}};
  }

  std::vector<CompilerInputCandidate> buildCandidates(
      const VerificationContent &content) {
    if (const auto *multi_file{std::get_if<MultiFileContent>(&content)}) {
      return buildCandidates(*multi_file);
    }
    return buildCandidates(std::get<StandardJsonContent>(content));
  }
}  // namespace scv::verifier
