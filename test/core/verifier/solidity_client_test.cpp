/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/solidity_client.hpp"

#include <gtest/gtest.h>

#include "testutil/default_print.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/eth/address_code_mock.hpp"
#include "testutil/mocks/verifier/candidate_verifier_mock.hpp"
#include "testutil/mocks/verifier/middleware_mock.hpp"
#include "testutil/outcome.hpp"
#include "verifier/impl/list_compiler_catalog.hpp"

namespace scv::verifier {
  using eth::AddressCodeMock;
  using testing::_;
  using testing::Return;

  class SolidityClientTest : public testing::Test {
   public:
    void SetUp() override {
      version = CompilerVersion::fromString("v0.8.7+commit.e28d00a7").value();
      catalog = std::make_shared<ListCompilerCatalog>(
          std::vector<CompilerVersion>{
              version, CompilerVersion::fromString("0.4.26").value()});
      client = std::make_shared<SolidityClient>(
          catalog, verifier, address_code, middleware);

      request.contract_address = "0xABCDEF";
      request.compiler_version = version;
      MultiFileContent content;
      content.sources = {{"a.sol", "contract A {}"}};
      content.optimization_runs = 200;
      request.content = content;

      success.file_name = "a.sol";
      success.contract_name = "A";
      success.compiler_version = version;
    }

    CompilerVersion version;
    std::shared_ptr<ListCompilerCatalog> catalog;
    std::shared_ptr<CandidateVerifierMock> verifier{
        std::make_shared<CandidateVerifierMock>()};
    std::shared_ptr<AddressCodeMock> address_code{
        std::make_shared<AddressCodeMock>()};
    std::shared_ptr<MiddlewareMock> middleware{
        std::make_shared<MiddlewareMock>()};
    std::shared_ptr<SolidityClient> client;
    VerificationRequest request;
    Success success;
    Bytes deployed{"0x6080"_unhex};
  };

  /**
   * @given deployed contract and matching sources
   * @when verifying request
   * @then code is fetched by lowercase address, match is returned and hook is
   * notified
   */
  TEST_F(SolidityClientTest, Verified) {
    EXPECT_CALL(*address_code, codeAt("0xabcdef"))
        .WillOnce(Return(outcome::success(boost::make_optional(deployed))));
    EXPECT_CALL(*verifier, verify(version, _, _, _))
        .WillOnce(Return(outcome::success(success)));
    EXPECT_CALL(*middleware, call(_)).WillOnce(Return(outcome::success()));
    EXPECT_OUTCOME_TRUE(result, client->verify(request));
    EXPECT_EQ(result.contract_name, "A");
    EXPECT_EQ(result.candidate_index, 0u);
    EXPECT_EQ(result.metadata_variant, BytecodeHash::kIpfs);
    EXPECT_EQ(result.compiler_input.settings.optimizer.runs, uint64_t{200});
  }

  /**
   * @given compiler version missing from catalog
   * @when verifying request
   * @then kVersionNotFound is returned before anything is fetched
   */
  TEST_F(SolidityClientTest, VersionNotFound) {
    request.compiler_version = CompilerVersion::fromString("0.7.0").value();
    EXPECT_CALL(*address_code, codeAt(_)).Times(0);
    EXPECT_CALL(*verifier, verify(_, _, _, _)).Times(0);
    EXPECT_OUTCOME_ERROR(VerificationError::kVersionNotFound,
                         client->verify(request));
  }

  /**
   * @given address without code
   * @when verifying request
   * @then kNoDeployedCode is returned and nothing is compiled
   */
  TEST_F(SolidityClientTest, NoDeployedCode) {
    EXPECT_CALL(*address_code, codeAt(_))
        .WillOnce(Return(outcome::success(boost::optional<Bytes>{})));
    EXPECT_CALL(*verifier, verify(_, _, _, _)).Times(0);
    EXPECT_OUTCOME_ERROR(VerificationError::kNoDeployedCode,
                         client->verify(request));
  }

  /**
   * @given node which cannot be asked for code
   * @when verifying request
   * @then kResolverUnavailable is returned
   */
  TEST_F(SolidityClientTest, ResolverUnavailable) {
    EXPECT_CALL(*address_code, codeAt(_))
        .WillOnce(Return(outcome::result<boost::optional<Bytes>>{
            std::make_error_code(std::errc::timed_out)}));
    EXPECT_CALL(*verifier, verify(_, _, _, _)).Times(0);
    EXPECT_OUTCOME_ERROR(VerificationError::kResolverUnavailable,
                         client->verify(request));
  }

  /**
   * @given request cancelled before it started
   * @when verifying request
   * @then kCancelled is returned and code is not fetched
   */
  TEST_F(SolidityClientTest, Cancelled) {
    auto cancel{std::make_shared<std::atomic<bool>>(true)};
    EXPECT_CALL(*address_code, codeAt(_)).Times(0);
    EXPECT_OUTCOME_ERROR(VerificationError::kCancelled,
                         client->verify(request, cancel));
  }

  /**
   * @given sources matching under no metadata variant
   * @when verifying request
   * @then every variant is tried and kNoMatchingContracts is returned
   */
  TEST_F(SolidityClientTest, NoMatch) {
    EXPECT_CALL(*address_code, codeAt(_))
        .WillOnce(Return(outcome::success(boost::make_optional(deployed))));
    EXPECT_CALL(*verifier, verify(_, _, _, _))
        .Times(3)
        .WillRepeatedly(Return(outcome::result<Success>{
            VerificationError::kNoMatchingContracts}));
    EXPECT_CALL(*middleware, call(_)).Times(0);
    EXPECT_OUTCOME_ERROR(VerificationError::kNoMatchingContracts,
                         client->verify(request));
  }
}  // namespace scv::verifier
