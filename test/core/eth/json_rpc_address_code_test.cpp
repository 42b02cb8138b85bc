/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "eth/impl/json_rpc_address_code.hpp"

#include <gtest/gtest.h>

#include "common/hexutil.hpp"
#include "common/http_requests/impl/request_factory_impl.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/common/http_requests/request_factory_mock.hpp"
#include "testutil/mocks/common/http_requests/request_mock.hpp"
#include "testutil/outcome.hpp"

namespace scv::eth {
  using common::ReqMethod;
  using common::Request;
  using common::RequestFactoryErrors;
  using common::RequestFactoryMock;
  using common::RequestMock;
  using common::Response;
  using testing::_;
  using testing::ByMove;
  using testing::Invoke;
  using testing::Return;

  class JsonRpcAddressCodeTest : public testing::Test {
   public:
    /**
     * Expects one eth_getCode call answered with given response
     */
    void expectCall(outcome::result<Response> response) {
      auto request{std::make_unique<RequestMock>()};
      EXPECT_CALL(*request, setupMethod(ReqMethod::POST));
      EXPECT_CALL(*request,
                  setupHeader(std::make_pair(std::string{"Content-Type"},
                                             std::string{"application/json"})));
      EXPECT_CALL(*request, setupTimeout(timeout));
      EXPECT_CALL(*request, setupBody(_))
          .WillOnce(Invoke(
              [this](const std::string &body) { bodies.push_back(body); }));
      EXPECT_CALL(*request, perform()).WillOnce(Return(response));
      EXPECT_CALL(*factory, newRequest(url))
          .InSequence(calls)
          .WillOnce(Return(ByMove(outcome::result<std::unique_ptr<Request>>{
              std::move(request)})));
    }

    Response reply(const std::string &body) const {
      return {200, "application/json", body};
    }

    const std::string url{"https://evmos-evm.publicnode.com"};
    const std::chrono::milliseconds timeout{30000};
    const std::string address{"0xabcdef0123456789abcdef0123456789abcdef01"};
    std::shared_ptr<RequestFactoryMock> factory{
        std::make_shared<RequestFactoryMock>()};
    JsonRpcAddressCode address_code{factory, url, timeout};
    std::vector<std::string> bodies;
    testing::Sequence calls;
  };

  /**
   * @given node with contract
   * @when asking code
   * @then eth_getCode request at latest block is posted and code is decoded
   */
  TEST_F(JsonRpcAddressCodeTest, Code) {
    expectCall(reply(R"({"jsonrpc":"2.0","id":1,"result":"0x6080604052"})"));
    expectCall(reply(R"({"jsonrpc":"2.0","id":2,"result":"0x6001"})"));
    EXPECT_OUTCOME_EQ(address_code.codeAt(address),
                      boost::make_optional("0x6080604052"_unhex));
    EXPECT_OUTCOME_EQ(address_code.codeAt(address),
                      boost::make_optional("0x6001"_unhex));
    EXPECT_EQ(
        bodies,
        (std::vector<std::string>{
            R"({"jsonrpc":"2.0","id":1,"method":"eth_getCode","params":["0xabcdef0123456789abcdef0123456789abcdef01","latest"]})",
            R"({"jsonrpc":"2.0","id":2,"method":"eth_getCode","params":["0xabcdef0123456789abcdef0123456789abcdef01","latest"]})"}));
  }

  /**
   * @given address without contract
   * @when asking code
   * @then "0x" is empty code and null result is absent code
   */
  TEST_F(JsonRpcAddressCodeTest, NoCode) {
    expectCall(reply(R"({"jsonrpc":"2.0","id":1,"result":"0x"})"));
    expectCall(reply(R"({"jsonrpc":"2.0","id":2,"result":null})"));
    EXPECT_OUTCOME_EQ(address_code.codeAt(address),
                      boost::make_optional(Bytes{}));
    EXPECT_OUTCOME_EQ(address_code.codeAt(address), boost::optional<Bytes>{});
  }

  /**
   * @given failing node
   * @when asking code
   * @then transport, status, rpc and format errors are distinguished
   */
  TEST_F(JsonRpcAddressCodeTest, Errors) {
    expectCall(outcome::result<Response>{RequestFactoryErrors::kTimeout});
    EXPECT_OUTCOME_ERROR(RequestFactoryErrors::kTimeout,
                         address_code.codeAt(address));

    expectCall(Response{502, "text/html", "Bad Gateway"});
    EXPECT_OUTCOME_ERROR(EthRpcError::kHttpStatus,
                         address_code.codeAt(address));

    expectCall(reply("<html>"));
    EXPECT_OUTCOME_ERROR(EthRpcError::kMalformedResponse,
                         address_code.codeAt(address));

    expectCall(reply(
        R"({"jsonrpc":"2.0","id":4,"error":{"code":-32602,"message":"invalid argument"}})"));
    EXPECT_OUTCOME_ERROR(EthRpcError::kRpcError, address_code.codeAt(address));

    expectCall(reply(R"({"jsonrpc":"2.0","id":5,"result":42})"));
    EXPECT_OUTCOME_ERROR(EthRpcError::kMalformedResponse,
                         address_code.codeAt(address));

    expectCall(reply(R"({"jsonrpc":"2.0","id":6,"result":"0xzz"})"));
    EXPECT_OUTCOME_ERROR(EthRpcError::kMalformedResponse,
                         address_code.codeAt(address));
  }

  /**
   * @given node replying without result member or with non-object json
   * @when asking code
   * @then reply is malformed, not absent code
   */
  TEST_F(JsonRpcAddressCodeTest, NoResult) {
    for (const auto body :
         {R"({"jsonrpc":"2.0","id":1})", "{}", "[]", R"("ok")", "42"}) {
      SCOPED_TRACE(body);
      expectCall(reply(body));
      EXPECT_OUTCOME_ERROR(EthRpcError::kMalformedResponse,
                           address_code.codeAt(address));
    }
  }

  /**
   * @given request factory which can not create request
   * @when asking code
   * @then its error is returned
   */
  TEST_F(JsonRpcAddressCodeTest, NoRequest) {
    EXPECT_CALL(*factory, newRequest(url))
        .WillOnce(Return(ByMove(outcome::result<std::unique_ptr<Request>>{
            RequestFactoryErrors::kUnableInit})));
    EXPECT_OUTCOME_ERROR(RequestFactoryErrors::kUnableInit,
                         address_code.codeAt(address));
  }
}  // namespace scv::eth
