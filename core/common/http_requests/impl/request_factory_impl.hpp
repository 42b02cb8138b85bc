/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_SCV_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_FACTORY_IMPL_HPP
#define CPP_SCV_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_FACTORY_IMPL_HPP

#include "common/http_requests/request_factory.hpp"

namespace scv::common {
  /**
   * Creates libcurl requests. Safe to use from several threads, each request
   * owns its own curl handle.
   */
  class RequestFactoryImpl : public RequestFactory {
   public:
    RequestFactoryImpl();

    outcome::result<std::unique_ptr<Request>> newRequest(
        const std::string &url) override;
  };

  enum class RequestFactoryErrors {
    kUnableInit = 1,
    kTransportFailure,
    kTimeout,
  };
}  // namespace scv::common

OUTCOME_HPP_DECLARE_ERROR(scv::common, RequestFactoryErrors);

#endif  // CPP_SCV_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_FACTORY_IMPL_HPP
