/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_SCV_CORE_COMMON_HTTP_REQUESTS_REQUEST_HPP
#define CPP_SCV_CORE_COMMON_HTTP_REQUESTS_REQUEST_HPP

#include <chrono>
#include <string>
#include <unordered_map>

#include "common/outcome.hpp"

namespace scv::common {

  using HeaderName = std::string;
  using HeaderValue = std::string;

  enum ReqMethod {
    GET,
    PUT,
    POST,
    DELETE,
  };

  struct Response {
    long status_code;
    std::string content_type;
    std::string body;
  };

  class Request {
   public:
    virtual ~Request() = default;

    virtual void setupUrl(const std::string &url) = 0;

    virtual void setupMethod(ReqMethod method) = 0;

    virtual void setupHeaders(
        const std::unordered_map<HeaderName, HeaderValue> &headers) = 0;

    virtual void setupHeader(
        const std::pair<HeaderName, HeaderValue> &header) = 0;

    virtual void setupBody(const std::string &body) = 0;

    /**
     * Limits whole transfer time, connection included
     */
    virtual void setupTimeout(std::chrono::milliseconds timeout) = 0;

    /**
     * Performs request and collects response body
     * @return response or transport error, any status code is a response
     */
    virtual outcome::result<Response> perform() = 0;
  };

}  // namespace scv::common

#endif  // CPP_SCV_CORE_COMMON_HTTP_REQUESTS_REQUEST_HPP
