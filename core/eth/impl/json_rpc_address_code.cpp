/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "eth/impl/json_rpc_address_code.hpp"

#include "codec/json/json.hpp"
#include "common/hexutil.hpp"
#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"

namespace scv::eth {
  using codec::json::Document;
  using codec::json::jSet;
  using codec::json::jString;
  using codec::json::Value;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("eth_rpc");
      return logger.get();
    }

    std::string getCodeRequest(uint64_t id, const std::string &address) {
      Document doc{rapidjson::kObjectType};
      auto &allocator{doc.GetAllocator()};
      jSet(doc, "jsonrpc", jString("2.0", allocator), allocator);
      jSet(doc, "id", Value{static_cast<uint64_t>(id)}, allocator);
      jSet(doc, "method", jString("eth_getCode", allocator), allocator);
      Value params{rapidjson::kArrayType};
      params.PushBack(jString(address, allocator), allocator);
      params.PushBack(jString("latest", allocator), allocator);
      jSet(doc, "params", std::move(params), allocator);
      return codec::json::format(&doc);
    }
  }  // namespace

  JsonRpcAddressCode::JsonRpcAddressCode(
      std::shared_ptr<common::RequestFactory> requests,
      std::string url,
      std::chrono::milliseconds timeout)
      : requests_{std::move(requests)},
        url_{std::move(url)},
        timeout_{timeout} {}

  outcome::result<boost::optional<Bytes>> JsonRpcAddressCode::codeAt(
      const std::string &address) const {
    OUTCOME_TRY(request, requests_->newRequest(url_));
    request->setupMethod(common::ReqMethod::POST);
    request->setupHeader({"Content-Type", "application/json"});
    request->setupTimeout(timeout_);
    request->setupBody(getCodeRequest(next_id_++, address));
    OUTCOME_TRY(response, request->perform());
    if (response.status_code < 200 || response.status_code >= 300) {
      log()->error("eth_getCode({}) http status {}",
                   address,
                   response.status_code);
      return EthRpcError::kHttpStatus;
    }

    auto _doc{codec::json::parse(response.body)};
    if (!_doc || !_doc.value().IsObject()) {
      log()->error("eth_getCode({}) response is not json", address);
      return EthRpcError::kMalformedResponse;
    }
    const auto &doc{_doc.value()};
    if (const auto error{codec::json::jGetOpt(&doc, "error")}) {
      log()->error("eth_getCode({}) rpc error: {}",
                   address,
                   codec::json::format(*error));
      return EthRpcError::kRpcError;
    }
    auto result{codec::json::jGet(&doc, "result")};
    if (!result) {
      log()->error("eth_getCode({}) response has no result", address);
      return EthRpcError::kMalformedResponse;
    }
    if (result.value()->IsNull()) {
      return boost::none;
    }
    auto hex{codec::json::jStr(result.value())};
    if (!hex) {
      log()->error("eth_getCode({}) result is not a string", address);
      return EthRpcError::kMalformedResponse;
    }
    auto code{common::unhex0x(hex.value())};
    if (!code) {
      log()->error("eth_getCode({}) result is not hex: {}",
                   address,
                   code.error());
      return EthRpcError::kMalformedResponse;
    }
    return std::move(code.value());
  }
}  // namespace scv::eth

OUTCOME_CPP_DEFINE_CATEGORY(scv::eth, EthRpcError, e) {
  using E = scv::eth::EthRpcError;
  switch (e) {
    case E::kHttpStatus:
      return "EthRpc: node replied with error status";
    case E::kMalformedResponse:
      return "EthRpc: malformed response";
    case E::kRpcError:
      return "EthRpc: node returned error";
  }
  return "EthRpc: unknown error";
}
