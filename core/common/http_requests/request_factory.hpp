/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_SCV_CORE_COMMON_HTTP_REQUESTS_REQUEST_FACTORY_HPP
#define CPP_SCV_CORE_COMMON_HTTP_REQUESTS_REQUEST_FACTORY_HPP

#include <memory>
#include <string>

#include "common/http_requests/request.hpp"

namespace scv::common {
  class RequestFactory {
   public:
    virtual ~RequestFactory() = default;

    virtual outcome::result<std::unique_ptr<Request>> newRequest(
        const std::string &url) = 0;
  };
}  // namespace scv::common

#endif  // CPP_SCV_CORE_COMMON_HTTP_REQUESTS_REQUEST_FACTORY_HPP
