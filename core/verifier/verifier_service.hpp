/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/async.hpp"
#include "common/io_thread.hpp"
#include "verifier/solidity_client.hpp"

namespace scv::verifier {
  /**
   * Runs verifications on worker threads, unrelated requests do not wait for
   * each other
   */
  class VerifierService {
   public:
    VerifierService(std::shared_ptr<SolidityClient> client, size_t threads);

    /**
     * Schedules verification, cb is called on worker thread
     * @param cancel - checked between attempts, may be null
     */
    void verify(VerificationRequest request,
                CancelFlag cancel,
                CbT<Success> cb);

    /**
     * Blocking form of verify
     */
    outcome::result<Success> verifySync(VerificationRequest request,
                                        CancelFlag cancel = nullptr);

   private:
    std::shared_ptr<SolidityClient> client_;
    /** last member, destroyed first so workers finish before client goes */
    IoThreads threads_;
  };
}  // namespace scv::verifier
