/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <map>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "common/bytes.hpp"
#include "common/cmp.hpp"
#include "common/enum.hpp"
#include "primitives/compiler_version/compiler_version.hpp"
#include "primitives/evm_version/evm_version.hpp"

namespace scv::verifier {
  using primitives::CompilerVersion;
  using primitives::EvmVersion;

  /** file path -> source text */
  using Sources = std::map<std::string, std::string>;
  /** library name -> address */
  using LibraryAddresses = std::map<std::string, std::string>;
  /** file path -> libraries the file may declare */
  using Libraries = std::map<std::string, LibraryAddresses>;
  /** file -> contract -> requested outputs, "" contract selects file level */
  using OutputSelection =
      std::map<std::string, std::map<std::string, std::vector<std::string>>>;
  /** settings members kept verbatim, name -> json text, document order */
  using RawMembers = std::vector<std::pair<std::string, std::string>>;

  /**
   * Dialect of sources, one compiler invocation accepts only one
   */
  enum class SourceLanguage {
    kSolidity,
    kYul,
  };

  inline auto &class_conversion_table(SourceLanguage &&) {
    using E = SourceLanguage;
    static common::ConversionTable<E, 2> table{
        {{E::kSolidity, "Solidity"}, {E::kYul, "Yul"}}};
    return table;
  }

  /**
   * Hash of metadata the compiler appends to bytecode
   */
  enum class BytecodeHash {
    kIpfs,
    kNone,
    kBzzr1,
  };

  inline auto &class_conversion_table(BytecodeHash &&) {
    using E = BytecodeHash;
    static common::ConversionTable<E, 3> table{
        {{E::kIpfs, "ipfs"}, {E::kNone, "none"}, {E::kBzzr1, "bzzr1"}}};
    return table;
  }

  /**
   * Metadata hash choice of one compile attempt, none keeps settings as they
   * are (compilers before 0.6.0 have no choice)
   */
  using MetadataVariant = boost::optional<BytecodeHash>;

  struct Optimizer {
    boost::optional<bool> enabled;
    boost::optional<uint64_t> runs;
    RawMembers extra;
  };
  inline auto fields(const Optimizer &v) {
    return std::tie(v.enabled, v.runs, v.extra);
  }
  SCV_COMPARE_FIELDS(Optimizer)

  struct MetadataSettings {
    boost::optional<bool> use_literal_content;
    boost::optional<BytecodeHash> bytecode_hash;
    RawMembers extra;
  };
  inline auto fields(const MetadataSettings &v) {
    return std::tie(v.use_literal_content, v.bytecode_hash, v.extra);
  }
  SCV_COMPARE_FIELDS(MetadataSettings)

  struct Settings {
    Optimizer optimizer;
    boost::optional<MetadataSettings> metadata;
    OutputSelection output_selection;
    boost::optional<EvmVersion> evm_version;
    Libraries libraries;
    /** members not modelled above */
    RawMembers extra;
  };
  inline auto fields(const Settings &v) {
    return std::tie(v.optimizer,
                    v.metadata,
                    v.output_selection,
                    v.evm_version,
                    v.libraries,
                    v.extra);
  }
  SCV_COMPARE_FIELDS(Settings)

  /**
   * Standard json compiler input
   */
  struct CompilerInput {
    SourceLanguage language{SourceLanguage::kSolidity};
    Sources sources;
    Settings settings;
  };
  inline auto fields(const CompilerInput &v) {
    return std::tie(v.language, v.sources, v.settings);
  }
  SCV_COMPARE_FIELDS(CompilerInput)

  /**
   * One compiler input the search may try
   */
  struct CompilerInputCandidate {
    CompilerInput input;
    /** input fixes metadata hash itself, it is tried once as is */
    bool metadata_pinned{false};
  };
  inline auto fields(const CompilerInputCandidate &v) {
    return std::tie(v.input, v.metadata_pinned);
  }
  SCV_COMPARE_FIELDS(CompilerInputCandidate)

  /**
   * Loose source files, compiler settings are partially known
   */
  struct MultiFileContent {
    Sources sources;
    boost::optional<EvmVersion> evm_version;
    /** optimizer is enabled iff runs are known */
    boost::optional<uint64_t> optimization_runs;
    /** file declaring each library is unknown */
    boost::optional<LibraryAddresses> contract_libraries;
  };

  /**
   * Compiler input assembled by caller
   */
  struct StandardJsonContent {
    CompilerInput input;
  };

  using VerificationContent =
      std::variant<MultiFileContent, StandardJsonContent>;

  struct VerificationRequest {
    /** any case, lowercased before use */
    std::string contract_address;
    /** when present, constructor bytecode is checked too */
    boost::optional<Bytes> creation_bytecode;
    CompilerVersion compiler_version;
    VerificationContent content;
  };

  enum class MatchType {
    kPartial,
    kFull,
  };

  inline auto &class_conversion_table(MatchType &&) {
    using E = MatchType;
    static common::ConversionTable<E, 2> table{
        {{E::kPartial, "PARTIAL"}, {E::kFull, "FULL"}}};
    return table;
  }

  struct Success {
    std::string file_name;
    std::string contract_name;
    CompilerVersion compiler_version;
    /** input matched, metadata variant applied */
    CompilerInput compiler_input;
    /** position of matched candidate in search order */
    size_t candidate_index{};
    MetadataVariant metadata_variant;
    /** json text, missing for Yul */
    boost::optional<std::string> abi;
    boost::optional<Bytes> constructor_arguments;
    Bytes local_creation_bytecode;
    Bytes local_deployed_bytecode;
    MatchType match_type{MatchType::kFull};
  };
  inline auto fields(const Success &v) {
    return std::tie(v.file_name,
                    v.contract_name,
                    v.compiler_version,
                    v.compiler_input,
                    v.candidate_index,
                    v.metadata_variant,
                    v.abi,
                    v.constructor_arguments,
                    v.local_creation_bytecode,
                    v.local_deployed_bytecode,
                    v.match_type);
  }
  SCV_COMPARE_FIELDS(Success)
}  // namespace scv::verifier
