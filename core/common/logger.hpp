/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace scv::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Sink shared by all loggers created after it is set, used to mirror log to
   * file
   */
  extern spdlog::sink_ptr file_sink;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);
}  // namespace scv::common
