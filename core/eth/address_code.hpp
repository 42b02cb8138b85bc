/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <string>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace scv::eth {
  /**
   * Reads code stored at address at latest block. Implementations are used
   * concurrently by independent verifications.
   */
  class AddressCode {
   public:
    virtual ~AddressCode() = default;

    /**
     * @param address - lowercase hex address with "0x" prefix
     * @return code, empty or none when there is no contract, error when node
     * could not be asked
     */
    virtual outcome::result<boost::optional<Bytes>> codeAt(
        const std::string &address) const = 0;
  };
}  // namespace scv::eth
