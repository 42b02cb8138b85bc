/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/response_json.hpp"

#include "codec/json/json.hpp"
#include "common/hexutil.hpp"
#include "verifier/compiler_input_json.hpp"

namespace scv::verifier {
  using codec::json::Allocator;
  using codec::json::Document;
  using codec::json::jSet;
  using codec::json::jString;
  using codec::json::Value;

  namespace {
    constexpr std::string_view kDefaultEvmVersion{"default"};
    constexpr std::string_view kMainPart{"main"};

    Value optionalString(const boost::optional<std::string> &str,
                         Allocator &allocator) {
      return str ? jString(*str, allocator) : Value{};
    }

    Value encodeStringMap(const std::map<std::string, std::string> &map,
                          Allocator &allocator) {
      Value j{rapidjson::kObjectType};
      for (const auto &[key, value] : map) {
        jSet(j, key, jString(value, allocator), allocator);
      }
      return j;
    }

    /**
     * Library addresses of all files, libraries are reported by name
     */
    LibraryAddresses flatLibraries(const Libraries &libraries) {
      LibraryAddresses flat;
      for (const auto &it : libraries) {
        flat.insert(it.second.begin(), it.second.end());
      }
      return flat;
    }

    /**
     * Bytecode as list of typed parts, whole code is one "main" part
     */
    Value encodeParts(BytesIn bytecode, Allocator &allocator) {
      Value parts{rapidjson::kArrayType};
      if (!bytecode.empty()) {
        Value part{rapidjson::kObjectType};
        jSet(part, "type", jString(kMainPart, allocator), allocator);
        jSet(part, "data", jString(common::hex0x(bytecode), allocator), allocator);
        parts.PushBack(part, allocator);
      }
      return parts;
    }

    Value encodeResult(const Success &success, Allocator &allocator) {
      const auto &settings{success.compiler_input.settings};
      Value j{rapidjson::kObjectType};
      jSet(j, "file_name", jString(success.file_name, allocator), allocator);
      jSet(j,
           "contract_name",
           jString(success.contract_name, allocator),
           allocator);
      jSet(j,
           "compiler_version",
           jString(success.compiler_version.toString(), allocator),
           allocator);
      jSet(j,
           "sources",
           encodeStringMap(success.compiler_input.sources, allocator),
           allocator);
      jSet(j,
           "evm_version",
           jString(settings.evm_version
                       ? primitives::toString(*settings.evm_version)
                       : kDefaultEvmVersion,
                   allocator),
           allocator);
      jSet(j,
           "optimization",
           settings.optimizer.enabled ? Value{*settings.optimizer.enabled}
                                      : Value{},
           allocator);
      jSet(j,
           "optimization_runs",
           settings.optimizer.runs
               ? Value{static_cast<uint64_t>(*settings.optimizer.runs)}
               : Value{},
           allocator);
      jSet(j,
           "contract_libraries",
           encodeStringMap(flatLibraries(settings.libraries), allocator),
           allocator);
      jSet(j,
           "compiler_settings",
           jString(encodeSettings(settings), allocator),
           allocator);
      jSet(j,
           "constructor_arguments",
           success.constructor_arguments
               ? jString(common::hex0x(*success.constructor_arguments),
                         allocator)
               : Value{},
           allocator);
      jSet(j, "abi", optionalString(success.abi, allocator), allocator);
      jSet(j,
           "local_creation_input_parts",
           encodeParts(success.local_creation_bytecode, allocator),
           allocator);
      jSet(j,
           "local_deployed_bytecode_parts",
           encodeParts(success.local_deployed_bytecode, allocator),
           allocator);
      jSet(j,
           "match_type",
           jString(common::to_string(success.match_type).value(), allocator),
           allocator);
      return j;
    }

    std::string encodeResponse(std::string_view message,
                               std::string_view status,
                               Value &&result,
                               Document &doc) {
      auto &allocator{doc.GetAllocator()};
      doc.SetObject();
      jSet(doc, "message", jString(message, allocator), allocator);
      jSet(doc, "status", jString(status, allocator), allocator);
      jSet(doc, "result", std::move(result), allocator);
      return codec::json::format(&doc);
    }
  }  // namespace

  std::string encodeSuccess(const Success &success) {
    Document doc;
    auto result{encodeResult(success, doc.GetAllocator())};
    return encodeResponse("OK", kStatusOk, std::move(result), doc);
  }

  std::string encodeFailure(const std::error_code &error) {
    Document doc;
    return encodeResponse(error.message(), kStatusFailed, Value{}, doc);
  }

  std::string encodeVersions(const std::vector<CompilerVersion> &versions) {
    Document doc;
    auto &allocator{doc.GetAllocator()};
    doc.SetObject();
    Value list{rapidjson::kArrayType};
    for (const auto &version : versions) {
      list.PushBack(jString(version.toString(), allocator), allocator);
    }
    jSet(doc, "versions", std::move(list), allocator);
    return codec::json::format(&doc);
  }
}  // namespace scv::verifier
