/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/http_requests/impl/request_factory_impl.hpp"

#include <mutex>

#include "common/http_requests/impl/request_impl.hpp"

namespace scv::common {

  RequestFactoryImpl::RequestFactoryImpl() {
    // curl_global_init is not thread safe, must run before any handle
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
  }

  outcome::result<std::unique_ptr<Request>> RequestFactoryImpl::newRequest(
      const std::string &url) {
    struct make_unique_enabler : public RequestImpl {
      make_unique_enabler() : RequestImpl{} {};
    };

    std::unique_ptr<RequestImpl> request =
        std::make_unique<make_unique_enabler>();

    if (!request->curl_) {
      return RequestFactoryErrors::kUnableInit;
    }

    request->setupUrl(url);

    return outcome::success(std::move(request));
  }
}  // namespace scv::common

OUTCOME_CPP_DEFINE_CATEGORY(scv::common, RequestFactoryErrors, e) {
  using scv::common::RequestFactoryErrors;
  switch (e) {
    case (RequestFactoryErrors::kUnableInit):
      return "RequestFactory: Unable to init a request";
    case (RequestFactoryErrors::kTransportFailure):
      return "RequestFactory: transport failure";
    case (RequestFactoryErrors::kTimeout):
      return "RequestFactory: request timed out";
    default:
      return "RequestFactory: unknown error";
  }
}
