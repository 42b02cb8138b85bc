/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/orchestrator.hpp"

#include <gtest/gtest.h>

#include "testutil/default_print.hpp"
#include "testutil/literals.hpp"
#include "testutil/mocks/verifier/candidate_verifier_mock.hpp"
#include "testutil/mocks/verifier/middleware_mock.hpp"
#include "testutil/outcome.hpp"
#include "verifier/impl/dry_run_verifier.hpp"

namespace scv::verifier {
  using testing::_;
  using testing::InSequence;
  using testing::Invoke;
  using testing::Return;
  using testing::Truly;

  outcome::result<Success> noMatch() {
    return VerificationError::kNoMatchingContracts;
  }

  MetadataVariant hashOf(const CompilerInput &input) {
    return input.settings.metadata ? input.settings.metadata->bytecode_hash
                                   : boost::none;
  }

  auto withHash(MetadataVariant variant) {
    return Truly([variant](const CompilerInput &input) {
      return hashOf(input) == variant;
    });
  }

  auto withLanguage(SourceLanguage language) {
    return Truly([language](const CompilerInput &input) {
      return input.language == language;
    });
  }

  class OrchestratorTest : public testing::Test {
   public:
    void SetUp() override {
      CompilerInput solidity;
      solidity.sources = {{"a.sol", "contract A {}"}};
      solidity.settings.optimizer.enabled = false;
      CompilerInput yul;
      yul.language = SourceLanguage::kYul;
      yul.sources = {{"b.yul", "object \"B\" {}"}};
      candidates = {{solidity}, {yul}};
    }

    Success matched() const {
      Success success;
      success.file_name = "a.sol";
      success.contract_name = "A";
      success.compiler_version = version;
      success.abi = "[]";
      success.local_deployed_bytecode = deployed;
      return success;
    }

    std::shared_ptr<CandidateVerifierMock> verifier{
        std::make_shared<CandidateVerifierMock>()};
    std::shared_ptr<MiddlewareMock> middleware{
        std::make_shared<MiddlewareMock>()};
    Orchestrator orchestrator{verifier, middleware};

    CompilerVersion version{
        CompilerVersion::fromString("v0.8.7+commit.e28d00a7").value()};
    CompilerVersion old_version{
        CompilerVersion::fromString("v0.5.17+commit.d19bba13").value()};
    Bytes deployed{"0x6080604052"_unhex};
    boost::optional<Bytes> creation{"0x60806040526001"_unhex};
    std::vector<CompilerInputCandidate> candidates;
  };

  /**
   * @given verifier matching third attempt
   * @when searching
   * @then exactly three attempts are made and success has third attempt
   * settings
   */
  TEST_F(OrchestratorTest, StopsAtFirstMatch) {
    {
      InSequence seq;
      EXPECT_CALL(*verifier,
                  verify(version, creation, _, withHash(BytecodeHash::kIpfs)))
          .WillOnce(Return(noMatch()));
      EXPECT_CALL(*verifier,
                  verify(version, creation, _, withHash(BytecodeHash::kNone)))
          .WillOnce(Return(noMatch()));
      EXPECT_CALL(*verifier,
                  verify(version, creation, _, withHash(BytecodeHash::kBzzr1)))
          .WillOnce(Return(matched()));
    }
    EXPECT_CALL(*middleware, call(_)).WillOnce(Return(outcome::success()));

    EXPECT_OUTCOME_TRUE(success,
                        orchestrator.verify(
                            candidates, version, creation, deployed));
    EXPECT_EQ(success.contract_name, "A");
    EXPECT_EQ(success.candidate_index, 0u);
    EXPECT_EQ(success.metadata_variant, BytecodeHash::kBzzr1);
    EXPECT_EQ(success.compiler_input.language, SourceLanguage::kSolidity);
    EXPECT_EQ(hashOf(success.compiler_input), BytecodeHash::kBzzr1);
    EXPECT_EQ(success.compiler_input.sources, candidates[0].input.sources);
  }

  /**
   * @given verifier failing compilation at first attempt
   * @when searching
   * @then only one attempt is made and error is returned as is
   */
  TEST_F(OrchestratorTest, StopsAtHardError) {
    EXPECT_CALL(*verifier, verify(_, _, _, _))
        .WillOnce(Return(outcome::result<Success>{
            VerificationError::kCompilation}));
    EXPECT_CALL(*middleware, call(_)).Times(0);

    EXPECT_OUTCOME_ERROR(
        VerificationError::kCompilation,
        orchestrator.verify(candidates, version, creation, deployed));
  }

  /**
   * @given verifier failing with errors other than no match
   * @when searching
   * @then every such error stops search
   */
  TEST_F(OrchestratorTest, EveryOtherErrorStops) {
    for (const auto error : {VerificationError::kCompilerVersionMismatch,
                             VerificationError::kInitialization,
                             VerificationError::kInternal}) {
      EXPECT_CALL(*verifier, verify(_, _, _, _))
          .WillOnce(Return(noMatch()))
          .WillOnce(Return(outcome::result<Success>{error}));
      EXPECT_OUTCOME_ERROR(
          error, orchestrator.verify(candidates, version, creation, deployed));
      testing::Mock::VerifyAndClearExpectations(verifier.get());
    }
  }

  /**
   * @given verifier never matching
   * @when searching
   * @then every candidate is tried with every variant and no match is
   * returned
   */
  TEST_F(OrchestratorTest, Exhaustion) {
    EXPECT_CALL(*verifier, verify(_, _, _, _))
        .Times(candidates.size() * 3)
        .WillRepeatedly(Return(noMatch()));
    EXPECT_CALL(*middleware, call(_)).Times(0);

    EXPECT_OUTCOME_ERROR(
        VerificationError::kNoMatchingContracts,
        orchestrator.verify(candidates, version, creation, deployed));
  }

  /**
   * @given compiler before 0.6.0 and verifier never matching
   * @when searching
   * @then each candidate is tried once without hash choice
   */
  TEST_F(OrchestratorTest, ExhaustionOldCompiler) {
    EXPECT_CALL(*verifier, verify(old_version, _, _, withHash(boost::none)))
        .Times(candidates.size())
        .WillRepeatedly(Return(noMatch()));

    EXPECT_OUTCOME_ERROR(
        VerificationError::kNoMatchingContracts,
        orchestrator.verify(candidates, old_version, creation, deployed));
  }

  /**
   * @given dry run verifier
   * @when searching
   * @then attempts follow candidate order, then variant order
   */
  TEST_F(OrchestratorTest, AttemptOrder) {
    auto dry_run{std::make_shared<DryRunVerifier>()};
    Orchestrator dry_orchestrator{dry_run, nullptr};
    EXPECT_OUTCOME_ERROR(
        VerificationError::kNoMatchingContracts,
        dry_orchestrator.verify(candidates, version, boost::none, deployed));

    const auto attempts{dry_run->attempts()};
    ASSERT_EQ(attempts.size(), 6u);
    const std::vector<MetadataVariant> hashes{
        BytecodeHash::kIpfs, BytecodeHash::kNone, BytecodeHash::kBzzr1};
    for (size_t i{0}; i < attempts.size(); ++i) {
      EXPECT_EQ(attempts[i].language, candidates[i / 3].input.language);
      EXPECT_EQ(attempts[i].sources, candidates[i / 3].input.sources);
      EXPECT_EQ(hashOf(attempts[i]), hashes[i % 3]);
    }
  }

  /**
   * @given match in first variant of second candidate
   * @when searching
   * @then success reports second candidate
   */
  TEST_F(OrchestratorTest, MatchInSecondCandidate) {
    EXPECT_CALL(*verifier,
                verify(_, _, _, withLanguage(SourceLanguage::kSolidity)))
        .Times(3)
        .WillRepeatedly(Return(noMatch()));
    EXPECT_CALL(*verifier, verify(_, _, _, withLanguage(SourceLanguage::kYul)))
        .WillOnce(Return(matched()));
    EXPECT_CALL(*middleware, call(_)).WillOnce(Return(outcome::success()));

    EXPECT_OUTCOME_TRUE(success,
                        orchestrator.verify(
                            candidates, version, creation, deployed));
    EXPECT_EQ(success.candidate_index, 1u);
    EXPECT_EQ(success.metadata_variant, BytecodeHash::kIpfs);
    EXPECT_EQ(success.compiler_input.language, SourceLanguage::kYul);
  }

  /**
   * @given candidate pinning metadata hash
   * @when searching
   * @then it is tried once as is
   */
  TEST_F(OrchestratorTest, PinnedCandidate) {
    auto input{candidates[0].input};
    input.settings.metadata = MetadataSettings{true, BytecodeHash::kNone, {}};
    const std::vector<CompilerInputCandidate> pinned{{input, true}};

    EXPECT_CALL(*verifier, verify(_, _, _, input)).WillOnce(Return(noMatch()));
    EXPECT_OUTCOME_ERROR(
        VerificationError::kNoMatchingContracts,
        orchestrator.verify(pinned, version, creation, deployed));

    EXPECT_CALL(*verifier, verify(_, _, _, input))
        .WillOnce(Return(matched()));
    EXPECT_CALL(*middleware, call(_)).WillOnce(Return(outcome::success()));
    EXPECT_OUTCOME_TRUE(success,
                        orchestrator.verify(pinned, version, creation, deployed));
    EXPECT_EQ(success.compiler_input, input);
    EXPECT_EQ(success.metadata_variant, BytecodeHash::kNone);
  }

  /**
   * @given hook which fails
   * @when match is found
   * @then hook receives success and its failure does not change result
   */
  TEST_F(OrchestratorTest, HookFailureIgnored) {
    EXPECT_CALL(*verifier, verify(_, _, _, _))
        .WillRepeatedly(Return(matched()));

    Success hooked;
    EXPECT_CALL(*middleware, call(_))
        .WillOnce(Invoke([&](const Success &success) -> outcome::result<void> {
          hooked = success;
          return VerificationError::kInternal;
        }));
    EXPECT_OUTCOME_TRUE(success,
                        orchestrator.verify(
                            candidates, version, creation, deployed));
    EXPECT_EQ(hooked, success);

    EXPECT_CALL(*middleware, call(_))
        .WillOnce(Invoke([](const Success &) -> outcome::result<void> {
          throw std::runtime_error{"hook"};
        }));
    EXPECT_OUTCOME_TRUE(again,
                        orchestrator.verify(
                            candidates, version, creation, deployed));
    EXPECT_EQ(again, success);

    EXPECT_CALL(*middleware, call(_))
        .WillOnce(Invoke([](const Success &) -> outcome::result<void> {
          throw 42;
        }));
    EXPECT_OUTCOME_TRUE(third,
                        orchestrator.verify(
                            candidates, version, creation, deployed));
    EXPECT_EQ(third, success);
  }

  /**
   * @given verifier throwing on first attempt
   * @when searching
   * @then search stops with kInternal after one attempt
   */
  TEST_F(OrchestratorTest, VerifierThrows) {
    EXPECT_CALL(*verifier, verify(_, _, _, _))
        .WillOnce(Invoke([](auto &&...) -> outcome::result<Success> {
          throw std::runtime_error{"compiler crashed"};
        }));
    EXPECT_CALL(*middleware, call(_)).Times(0);
    EXPECT_OUTCOME_ERROR(
        VerificationError::kInternal,
        orchestrator.verify(candidates, version, creation, deployed));
  }

  /**
   * @given orchestrator without hook
   * @when match is found
   * @then success is returned
   */
  TEST_F(OrchestratorTest, NoHook) {
    Orchestrator bare{verifier, nullptr};
    EXPECT_CALL(*verifier, verify(_, _, _, _)).WillOnce(Return(matched()));
    EXPECT_OUTCOME_TRUE(success,
                        bare.verify(candidates, version, creation, deployed));
    EXPECT_EQ(success.file_name, "a.sol");
  }

  /**
   * @given cancelled request
   * @when searching
   * @then no attempt is made
   */
  TEST_F(OrchestratorTest, CancelledBeforeStart) {
    auto cancel{std::make_shared<std::atomic<bool>>(true)};
    EXPECT_CALL(*verifier, verify(_, _, _, _)).Times(0);
    EXPECT_OUTCOME_ERROR(
        VerificationError::kCancelled,
        orchestrator.verify(candidates, version, creation, deployed, cancel));
  }

  /**
   * @given request cancelled while attempt runs
   * @when attempt matches
   * @then its result is dropped and hook is not called
   */
  TEST_F(OrchestratorTest, CancelledDuringAttempt) {
    auto cancel{std::make_shared<std::atomic<bool>>(false)};
    EXPECT_CALL(*verifier, verify(_, _, _, _))
        .WillOnce(Invoke([&](auto &&...) -> outcome::result<Success> {
          *cancel = true;
          return matched();
        }));
    EXPECT_CALL(*middleware, call(_)).Times(0);
    EXPECT_OUTCOME_ERROR(
        VerificationError::kCancelled,
        orchestrator.verify(candidates, version, creation, deployed, cancel));
  }

  /**
   * @given deterministic verifier
   * @when same search runs twice
   * @then results are equal
   */
  TEST_F(OrchestratorTest, Idempotent) {
    EXPECT_CALL(*verifier, verify(_, _, _, withHash(BytecodeHash::kIpfs)))
        .WillRepeatedly(Return(noMatch()));
    EXPECT_CALL(*verifier, verify(_, _, _, withHash(BytecodeHash::kNone)))
        .WillRepeatedly(Return(matched()));
    EXPECT_CALL(*middleware, call(_))
        .WillRepeatedly(Return(outcome::success()));

    EXPECT_OUTCOME_TRUE(first,
                        orchestrator.verify(
                            candidates, version, creation, deployed));
    EXPECT_OUTCOME_TRUE(second,
                        orchestrator.verify(
                            candidates, version, creation, deployed));
    EXPECT_EQ(first, second);

    EXPECT_CALL(*verifier, verify(_, _, _, _))
        .WillRepeatedly(Return(outcome::result<Success>{
            VerificationError::kCompilation}));
    EXPECT_EQ(orchestrator.verify(candidates, version, creation, deployed)
                  .error(),
              orchestrator.verify(candidates, version, creation, deployed)
                  .error());
  }
}  // namespace scv::verifier
