/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/compiler_input_json.hpp"

#include "common/logger.hpp"

namespace scv::verifier {
  using codec::json::Allocator;
  using codec::json::Document;
  using codec::json::JIn;
  using codec::json::JsonError;
  using codec::json::jSet;
  using codec::json::jString;
  using codec::json::Value;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("compiler_input");
      return logger.get();
    }

    void setRaw(Value &j, const RawMembers &members, Allocator &allocator) {
      for (const auto &[name, text] : members) {
        Document raw{&allocator};
        raw.Parse(text.data(), text.size());
        if (raw.HasParseError()) {
          log()->warn("skipping setting \"{}\" with invalid json", name);
          continue;
        }
        Value value;
        value.CopyFrom(raw, allocator);
        jSet(j, name, std::move(value), allocator);
      }
    }

    template <typename E>
    Value encodeEnum(E value, Allocator &allocator) {
      return jString(common::to_string(value).value(), allocator);
    }

    Value encodeOptimizer(const Optimizer &optimizer, Allocator &allocator) {
      Value j{rapidjson::kObjectType};
      if (optimizer.enabled) {
        jSet(j, "enabled", Value{*optimizer.enabled}, allocator);
      }
      if (optimizer.runs) {
        jSet(j,
             "runs",
             Value{static_cast<uint64_t>(*optimizer.runs)},
             allocator);
      }
      setRaw(j, optimizer.extra, allocator);
      return j;
    }

    Value encodeMetadata(const MetadataSettings &metadata,
                         Allocator &allocator) {
      Value j{rapidjson::kObjectType};
      if (metadata.use_literal_content) {
        jSet(j,
             "useLiteralContent",
             Value{*metadata.use_literal_content},
             allocator);
      }
      if (metadata.bytecode_hash) {
        jSet(j,
             "bytecodeHash",
             encodeEnum(*metadata.bytecode_hash, allocator),
             allocator);
      }
      setRaw(j, metadata.extra, allocator);
      return j;
    }

    Value encodeOutputSelection(const OutputSelection &selection,
                                Allocator &allocator) {
      Value j{rapidjson::kObjectType};
      for (const auto &[file, contracts] : selection) {
        Value j_contracts{rapidjson::kObjectType};
        for (const auto &[contract, outputs] : contracts) {
          Value j_outputs{rapidjson::kArrayType};
          for (const auto &output : outputs) {
            j_outputs.PushBack(jString(output, allocator), allocator);
          }
          jSet(j_contracts, contract, std::move(j_outputs), allocator);
        }
        jSet(j, file, std::move(j_contracts), allocator);
      }
      return j;
    }

    Value encodeLibraries(const Libraries &libraries, Allocator &allocator) {
      Value j{rapidjson::kObjectType};
      for (const auto &[file, addresses] : libraries) {
        Value j_addresses{rapidjson::kObjectType};
        for (const auto &[name, address] : addresses) {
          jSet(j_addresses, name, jString(address, allocator), allocator);
        }
        jSet(j, file, std::move(j_addresses), allocator);
      }
      return j;
    }

    outcome::result<RawMembers> decodeRaw(JIn j,
                                          std::initializer_list<const char *>
                                              modelled) {
      RawMembers raw;
      OUTCOME_TRY(codec::json::jObject(
          j, [&](auto name, auto value) -> outcome::result<void> {
            for (const auto *known : modelled) {
              if (name == known) {
                return outcome::success();
              }
            }
            raw.emplace_back(name, codec::json::format(value));
            return outcome::success();
          }));
      return raw;
    }

    template <typename E>
    outcome::result<E> decodeEnum(JIn j) {
      OUTCOME_TRY(str, codec::json::jStr(j));
      if (auto value{common::from_string<E>(str)}) {
        return *value;
      }
      return JsonError::kWrongEnum;
    }

    outcome::result<Optimizer> decodeOptimizer(JIn j) {
      Optimizer optimizer;
      if (auto enabled{codec::json::jGetOpt(j, "enabled")}) {
        OUTCOME_TRY(value, codec::json::jBool(*enabled));
        optimizer.enabled = value;
      }
      if (auto runs{codec::json::jGetOpt(j, "runs")}) {
        OUTCOME_TRY(value, codec::json::jUint(*runs));
        optimizer.runs = value;
      }
      OUTCOME_TRYA(optimizer.extra, decodeRaw(j, {"enabled", "runs"}));
      return optimizer;
    }

    outcome::result<MetadataSettings> decodeMetadata(JIn j) {
      MetadataSettings metadata;
      if (auto literal{codec::json::jGetOpt(j, "useLiteralContent")}) {
        OUTCOME_TRY(value, codec::json::jBool(*literal));
        metadata.use_literal_content = value;
      }
      if (auto hash{codec::json::jGetOpt(j, "bytecodeHash")}) {
        OUTCOME_TRY(value, decodeEnum<BytecodeHash>(*hash));
        metadata.bytecode_hash = value;
      }
      OUTCOME_TRYA(metadata.extra,
                   decodeRaw(j, {"useLiteralContent", "bytecodeHash"}));
      return metadata;
    }

    outcome::result<OutputSelection> decodeOutputSelection(JIn j) {
      OutputSelection selection;
      OUTCOME_TRY(codec::json::jObject(
          j, [&](auto file, auto j_contracts) -> outcome::result<void> {
            auto &contracts{selection[std::string{file}]};
            return codec::json::jObject(
                j_contracts,
                [&](auto contract, auto j_outputs) -> outcome::result<void> {
                  if (!j_outputs->IsArray()) {
                    return JsonError::kWrongType;
                  }
                  auto &outputs{contracts[std::string{contract}]};
                  for (const auto &it : j_outputs->GetArray()) {
                    OUTCOME_TRY(output, codec::json::jStr(&it));
                    outputs.emplace_back(output);
                  }
                  return outcome::success();
                });
          }));
      return selection;
    }

    outcome::result<Libraries> decodeLibraries(JIn j) {
      Libraries libraries;
      OUTCOME_TRY(codec::json::jObject(
          j, [&](auto file, auto j_addresses) -> outcome::result<void> {
            OUTCOME_TRY(addresses, codec::json::jStrMap(j_addresses));
            libraries.emplace(file, std::move(addresses));
            return outcome::success();
          }));
      return libraries;
    }

    outcome::result<Settings> decodeSettings(JIn j) {
      Settings settings;
      if (auto optimizer{codec::json::jGetOpt(j, "optimizer")}) {
        OUTCOME_TRYA(settings.optimizer, decodeOptimizer(*optimizer));
      }
      if (auto metadata{codec::json::jGetOpt(j, "metadata")}) {
        OUTCOME_TRY(value, decodeMetadata(*metadata));
        settings.metadata = std::move(value);
      }
      if (auto selection{codec::json::jGetOpt(j, "outputSelection")}) {
        OUTCOME_TRYA(settings.output_selection,
                     decodeOutputSelection(*selection));
      }
      if (auto evm_version{codec::json::jGetOpt(j, "evmVersion")}) {
        OUTCOME_TRY(str, codec::json::jStr(*evm_version));
        OUTCOME_TRY(value, primitives::evmVersionFromString(str));
        settings.evm_version = value;
      }
      if (auto libraries{codec::json::jGetOpt(j, "libraries")}) {
        OUTCOME_TRYA(settings.libraries, decodeLibraries(*libraries));
      }
      OUTCOME_TRYA(settings.extra,
                   decodeRaw(j,
                             {"optimizer",
                              "metadata",
                              "outputSelection",
                              "evmVersion",
                              "libraries"}));
      return settings;
    }
  }  // namespace

  Value encodeSettings(const Settings &settings, Allocator &allocator) {
    Value j{rapidjson::kObjectType};
    const auto &optimizer{settings.optimizer};
    if (optimizer.enabled || optimizer.runs || !optimizer.extra.empty()) {
      jSet(j, "optimizer", encodeOptimizer(optimizer, allocator), allocator);
    }
    if (settings.metadata) {
      jSet(j,
           "metadata",
           encodeMetadata(*settings.metadata, allocator),
           allocator);
    }
    if (!settings.output_selection.empty()) {
      jSet(j,
           "outputSelection",
           encodeOutputSelection(settings.output_selection, allocator),
           allocator);
    }
    if (settings.evm_version) {
      jSet(j,
           "evmVersion",
           jString(primitives::toString(*settings.evm_version), allocator),
           allocator);
    }
    jSet(j,
         "libraries",
         encodeLibraries(settings.libraries, allocator),
         allocator);
    setRaw(j, settings.extra, allocator);
    return j;
  }

  std::string encodeSettings(const Settings &settings) {
    Document doc;
    auto &allocator{doc.GetAllocator()};
    auto j{encodeSettings(settings, allocator)};
    return codec::json::format(&j);
  }

  std::string encodeCompilerInput(const CompilerInput &input) {
    Document doc{rapidjson::kObjectType};
    auto &allocator{doc.GetAllocator()};
    jSet(doc, "language", encodeEnum(input.language, allocator), allocator);
    Value sources{rapidjson::kObjectType};
    for (const auto &[path, content] : input.sources) {
      Value source{rapidjson::kObjectType};
      jSet(source, "content", jString(content, allocator), allocator);
      jSet(sources, path, std::move(source), allocator);
    }
    jSet(doc, "sources", std::move(sources), allocator);
    jSet(doc, "settings", encodeSettings(input.settings, allocator), allocator);
    return codec::json::format(&doc);
  }

  outcome::result<CompilerInput> decodeCompilerInput(std::string_view json) {
    OUTCOME_TRY(doc, codec::json::parse(json));
    CompilerInput input;
    OUTCOME_TRY(language, codec::json::jGet(&doc, "language"));
    OUTCOME_TRYA(input.language, decodeEnum<SourceLanguage>(language));
    OUTCOME_TRY(sources, codec::json::jGet(&doc, "sources"));
    OUTCOME_TRY(codec::json::jObject(
        sources, [&](auto path, auto source) -> outcome::result<void> {
          OUTCOME_TRY(j_content, codec::json::jGet(source, "content"));
          OUTCOME_TRY(content, codec::json::jStr(j_content));
          input.sources.emplace(path, content);
          return outcome::success();
        }));
    if (auto settings{codec::json::jGetOpt(&doc, "settings")}) {
      OUTCOME_TRYA(input.settings, decodeSettings(*settings));
    }
    return input;
  }
}  // namespace scv::verifier
