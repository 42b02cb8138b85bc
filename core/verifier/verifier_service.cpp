/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/verifier_service.hpp"

#include <boost/asio/post.hpp>
#include <future>

#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"

namespace scv::verifier {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("service");
      return logger.get();
    }
  }  // namespace

  VerifierService::VerifierService(std::shared_ptr<SolidityClient> client,
                                   size_t threads)
      : client_{std::move(client)}, threads_{threads} {
    log()->info("verification service started, {} workers",
                threads_.threads.size());
  }

  void VerifierService::verify(VerificationRequest request,
                               CancelFlag cancel,
                               CbT<Success> cb) {
    boost::asio::post(*threads_.io,
                      [client{client_},
                       request{std::move(request)},
                       cancel{std::move(cancel)},
                       cb{std::move(cb)}] {
                        auto result{client->verify(request, cancel)};
                        if (!result) {
                          log()->debug("verification of {} failed: {}",
                                       request.contract_address,
                                       result.error());
                        }
                        cb(std::move(result));
                      });
  }

  outcome::result<Success> VerifierService::verifySync(
      VerificationRequest request, CancelFlag cancel) {
    std::promise<outcome::result<Success>> promise;
    auto future{promise.get_future()};
    verify(std::move(request),
           std::move(cancel),
           [&promise](outcome::result<Success> result) {
             promise.set_value(std::move(result));
           });
    return future.get();
  }
}  // namespace scv::verifier
