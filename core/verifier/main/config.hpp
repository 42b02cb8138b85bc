/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>
#include <chrono>

#include "common/logger.hpp"

namespace scv::config {
  /**
   * Request document accepted by planning command
   */
  enum class RequestKind {
    kMultiPart,
    kStandardJson,
  };

  struct Config {
    std::string rpc_url;
    std::chrono::seconds rpc_timeout{};
    /** directory whose entries are named after compiler versions */
    boost::optional<boost::filesystem::path> compilers_dir;
    /** catalog entries given inline */
    std::vector<std::string> compiler_versions;
    size_t threads{};
    spdlog::level::level_enum log_level{spdlog::level::info};
    boost::optional<boost::filesystem::path> log_file;

    // commands
    bool list_versions{false};
    boost::optional<std::string> code_address;
    boost::optional<boost::filesystem::path> plan;
    RequestKind kind{RequestKind::kMultiPart};

    static Config read(int argc, char *argv[]);
  };

  spdlog::level::level_enum getLogLevel(char level);
}  // namespace scv::config
