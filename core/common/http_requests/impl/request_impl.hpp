/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_SCV_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_IMPL_HPP
#define CPP_SCV_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_IMPL_HPP

#include "common/http_requests/request.hpp"

#include <curl/curl.h>

namespace scv::common {

  class RequestFactoryImpl;

  class RequestImpl : public Request {
   public:
    RequestImpl(const RequestImpl &) = delete;
    RequestImpl(RequestImpl &&) = delete;
    ~RequestImpl() override;
    RequestImpl &operator=(const RequestImpl &) = delete;
    RequestImpl &operator=(RequestImpl &&) = delete;

    void setupUrl(const std::string &url) override;

    void setupMethod(ReqMethod method) override;

    void setupHeaders(
        const std::unordered_map<std::string, std::string> &headers) override;

    void setupHeader(
        const std::pair<std::string, std::string> &header) override;

    void setupBody(const std::string &body) override;

    void setupTimeout(std::chrono::milliseconds timeout) override;

    outcome::result<Response> perform() override;

   private:
    RequestImpl();
    friend class RequestFactoryImpl;

    struct curl_slist *headers_;
    CURL *curl_;
    /** curl keeps pointer to body, so it lives as long as request */
    std::string body_;
  };

}  // namespace scv::common

#endif  // CPP_SCV_CORE_COMMON_HTTP_REQUESTS_IMPL_REQUEST_IMPL_HPP
