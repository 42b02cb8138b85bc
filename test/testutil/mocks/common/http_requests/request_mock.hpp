/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "common/http_requests/request.hpp"

namespace scv::common {
  class RequestMock : public Request {
   public:
    MOCK_METHOD1(setupUrl, void(const std::string &));
    MOCK_METHOD1(setupMethod, void(ReqMethod));
    MOCK_METHOD1(
        setupHeaders,
        void(const std::unordered_map<HeaderName, HeaderValue> &));
    MOCK_METHOD1(setupHeader,
                 void(const std::pair<HeaderName, HeaderValue> &));
    MOCK_METHOD1(setupBody, void(const std::string &));
    MOCK_METHOD1(setupTimeout, void(std::chrono::milliseconds));
    MOCK_METHOD0(perform, outcome::result<Response>());
  };
}  // namespace scv::common
