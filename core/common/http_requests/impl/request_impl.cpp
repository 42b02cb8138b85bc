/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/http_requests/impl/request_impl.hpp"

#include "common/http_requests/impl/request_factory_impl.hpp"
#include "common/logger.hpp"

namespace scv::common {
  namespace {
    auto log() {
      static Logger logger = createLogger("http");
      return logger.get();
    }

    size_t writeToString(char *ptr, size_t size, size_t nmemb, void *output) {
      static_cast<std::string *>(output)->append(ptr, size * nmemb);
      return size * nmemb;
    }
  }  // namespace

  void RequestImpl::setupUrl(const std::string &url) {
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
  }

  void RequestImpl::setupMethod(ReqMethod method) {
    switch (method) {
      case ReqMethod::GET:
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "GET");
        return;
      case ReqMethod::DELETE:
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "DELETE");
        return;
      case ReqMethod::POST:
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        return;
      case ReqMethod::PUT:
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, "PUT");
        return;
      default:
        return;
    }
  }

  void RequestImpl::setupHeaders(
      const std::unordered_map<std::string, std::string> &headers) {
    for (const auto &header : headers) {
      setupHeader(header);
    }
  }

  void RequestImpl::setupHeader(
      const std::pair<std::string, std::string> &header) {
    headers_ = curl_slist_append(headers_,
                                 (header.first + ": " + header.second).c_str());
  }

  void RequestImpl::setupBody(const std::string &body) {
    body_ = body;
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_.c_str());
    curl_easy_setopt(
        curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_.size()));
  }

  void RequestImpl::setupTimeout(std::chrono::milliseconds timeout) {
    curl_easy_setopt(
        curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  }

  outcome::result<Response> RequestImpl::perform() {
    Response res{};

    if (headers_) {
      curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &res.body);

    const auto code{curl_easy_perform(curl_)};
    if (code == CURLE_OPERATION_TIMEDOUT) {
      log()->warn("request timed out: {}", curl_easy_strerror(code));
      return RequestFactoryErrors::kTimeout;
    }
    if (code != CURLE_OK) {
      log()->warn("request failed: {}", curl_easy_strerror(code));
      return RequestFactoryErrors::kTransportFailure;
    }
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &res.status_code);
    char *content_type{nullptr};
    curl_easy_getinfo(curl_, CURLINFO_CONTENT_TYPE, &content_type);
    if (content_type != nullptr) {
      res.content_type = content_type;
    }

    return res;
  }

  RequestImpl::~RequestImpl() {
    if (curl_) {
      curl_easy_cleanup(curl_);
    }

    if (headers_) {
      curl_slist_free_all(headers_);
    }
  }

  RequestImpl::RequestImpl() : headers_(nullptr), curl_(curl_easy_init()) {
    if (curl_) {
      curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

      // Follow HTTP redirects if necessary
      curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    }
  }

}  // namespace scv::common
