/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "eth/address_code.hpp"

namespace scv::verifier {
  /**
   * Fetches bytecode deployed at contract address from latest block
   */
  class DeployedBytecodeResolver {
   public:
    explicit DeployedBytecodeResolver(
        std::shared_ptr<eth::AddressCode> address_code);

    /**
     * @param address - contract address, any case
     * @return raw deployed bytecode, kNoDeployedCode when address has no
     * code, kResolverUnavailable when code could not be fetched
     */
    outcome::result<Bytes> resolve(const std::string &address) const;

   private:
    std::shared_ptr<eth::AddressCode> address_code_;
  };
}  // namespace scv::verifier
