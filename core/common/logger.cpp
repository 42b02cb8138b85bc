/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace scv::common {
  spdlog::sink_ptr file_sink;

  namespace {
    constexpr auto kPattern{"[%Y-%m-%d %H:%M:%S.%e][th:%t][%l][%n] %v"};

    Logger createSpdLogger(const std::string &tag) {
      std::vector<spdlog::sink_ptr> sinks{
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
      if (file_sink) {
        sinks.push_back(file_sink);
      }
      auto logger{
          std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end())};
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::get_level());
      spdlog::register_logger(logger);
      return logger;
    }
  }  // namespace

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard lock{mutex};
    auto logger{spdlog::get(tag)};
    if (logger == nullptr) {
      logger = createSpdLogger(tag);
    }
    return logger;
  }
}  // namespace scv::common
