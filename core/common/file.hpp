/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>

#include "common/outcome.hpp"

namespace scv::common {
  enum class FileError {
    kCannotRead = 1,
  };

  /**
   * Reads whole file as text
   */
  outcome::result<std::string> readFile(const boost::filesystem::path &path);
}  // namespace scv::common

OUTCOME_HPP_DECLARE_ERROR(scv::common, FileError);
