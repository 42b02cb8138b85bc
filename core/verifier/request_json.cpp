/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/request_json.hpp"

#include "codec/json/json.hpp"
#include "common/hexutil.hpp"
#include "verifier/compiler_input_json.hpp"

namespace scv::verifier {
  using codec::json::Document;
  using codec::json::JIn;
  using codec::json::JsonError;

  namespace {
    constexpr std::string_view kDefaultEvmVersion{"default"};

    outcome::result<Document> parseRequest(std::string_view json) {
      auto doc{codec::json::parse(json)};
      if (!doc || !doc.value().IsObject()) {
        return RequestError::kInvalidJson;
      }
      return std::move(doc.value());
    }

    outcome::result<JIn> field(JIn j, std::string_view key) {
      auto value{codec::json::jGet(j, key)};
      if (!value) {
        if (value.error() == JsonError::kMissingField) {
          return RequestError::kMissingField;
        }
        return RequestError::kInvalidField;
      }
      return value.value();
    }

    outcome::result<std::string> stringField(JIn j, std::string_view key) {
      OUTCOME_TRY(value, field(j, key));
      auto str{codec::json::jStr(value)};
      if (!str) {
        return RequestError::kInvalidField;
      }
      return std::string{str.value()};
    }

    /**
     * Members shared by both request kinds
     */
    outcome::result<VerificationRequest> decodeCommon(JIn j) {
      VerificationRequest request;
      OUTCOME_TRYA(request.contract_address, stringField(j, "contract_address"));

      if (const auto creation{codec::json::jGetOpt(j, "creation_bytecode")}) {
        auto hex{codec::json::jStr(*creation)};
        if (!hex) {
          return RequestError::kInvalidCreationBytecode;
        }
        auto bytes{common::unhex0x(hex.value())};
        if (!bytes) {
          return RequestError::kInvalidCreationBytecode;
        }
        request.creation_bytecode = std::move(bytes.value());
      }

      OUTCOME_TRY(version_str, stringField(j, "compiler_version"));
      auto version{CompilerVersion::fromString(version_str)};
      if (!version) {
        return RequestError::kInvalidCompilerVersion;
      }
      request.compiler_version = std::move(version.value());
      return request;
    }

    outcome::result<std::map<std::string, std::string>> stringMapField(
        JIn j, std::string_view key) {
      OUTCOME_TRY(value, field(j, key));
      auto map{codec::json::jStrMap(value)};
      if (!map) {
        return RequestError::kInvalidField;
      }
      return std::move(map.value());
    }
  }  // namespace

  outcome::result<VerificationRequest> decodeMultiPartRequest(
      std::string_view json) {
    OUTCOME_TRY(doc, parseRequest(json));
    OUTCOME_TRY(request, decodeCommon(&doc));

    MultiFileContent content;
    OUTCOME_TRYA(content.sources, stringMapField(&doc, "sources"));

    if (const auto evm{codec::json::jGetOpt(&doc, "evm_version")}) {
      auto name{codec::json::jStr(*evm)};
      if (!name) {
        return RequestError::kInvalidEvmVersion;
      }
      if (name.value() != kDefaultEvmVersion) {
        auto evm_version{primitives::evmVersionFromString(name.value())};
        if (!evm_version) {
          return RequestError::kInvalidEvmVersion;
        }
        content.evm_version = evm_version.value();
      }
    }

    if (const auto runs{codec::json::jGetOpt(&doc, "optimization_runs")}) {
      auto value{codec::json::jUint(*runs)};
      if (!value) {
        return RequestError::kInvalidField;
      }
      content.optimization_runs = value.value();
    }

    if (codec::json::jGetOpt(&doc, "contract_libraries")) {
      OUTCOME_TRY(libraries, stringMapField(&doc, "contract_libraries"));
      content.contract_libraries = std::move(libraries);
    }

    request.content = std::move(content);
    return request;
  }

  outcome::result<VerificationRequest> decodeStandardJsonRequest(
      std::string_view json) {
    OUTCOME_TRY(doc, parseRequest(json));
    OUTCOME_TRY(request, decodeCommon(&doc));

    OUTCOME_TRY(input_json, stringField(&doc, "input"));
    auto input{decodeCompilerInput(input_json)};
    if (!input) {
      return RequestError::kInvalidContent;
    }
    request.content = StandardJsonContent{std::move(input.value())};
    return request;
  }
}  // namespace scv::verifier

OUTCOME_CPP_DEFINE_CATEGORY(scv::verifier, RequestError, e) {
  using E = scv::verifier::RequestError;
  switch (e) {
    case E::kInvalidJson:
      return "RequestError: request is not a json object";
    case E::kMissingField:
      return "RequestError: required field is missing";
    case E::kInvalidField:
      return "RequestError: field has invalid type";
    case E::kInvalidCreationBytecode:
      return "RequestError: invalid creation bytecode";
    case E::kInvalidCompilerVersion:
      return "RequestError: invalid compiler version";
    case E::kInvalidEvmVersion:
      return "RequestError: invalid evm version";
    case E::kInvalidContent:
      return "RequestError: content is not valid standard json";
  }
  return "RequestError: unknown error";
}
