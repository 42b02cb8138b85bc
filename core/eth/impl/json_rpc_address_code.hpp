/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <chrono>
#include <memory>

#include "common/http_requests/request_factory.hpp"
#include "eth/address_code.hpp"

namespace scv::eth {
  enum class EthRpcError {
    kHttpStatus = 1,
    kMalformedResponse,
    kRpcError,
  };

  /**
   * Asks node with eth_getCode JSON-RPC call over http
   */
  class JsonRpcAddressCode : public AddressCode {
   public:
    JsonRpcAddressCode(std::shared_ptr<common::RequestFactory> requests,
                       std::string url,
                       std::chrono::milliseconds timeout);

    outcome::result<boost::optional<Bytes>> codeAt(
        const std::string &address) const override;

   private:
    std::shared_ptr<common::RequestFactory> requests_;
    std::string url_;
    std::chrono::milliseconds timeout_;
    mutable std::atomic<uint64_t> next_id_{1};
  };
}  // namespace scv::eth

OUTCOME_HPP_DECLARE_ERROR(scv::eth, EthRpcError);
