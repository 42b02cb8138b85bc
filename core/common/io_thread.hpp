/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <thread>
#include <vector>

namespace scv {
  /**
   * io_context served by fixed number of threads. Destructor lets posted
   * handlers finish and joins threads.
   */
  struct IoThreads {
    inline explicit IoThreads(size_t count)
        : io{std::make_shared<boost::asio::io_context>()},
          work{io->get_executor()} {
      if (count == 0) {
        count = 1;
      }
      threads.reserve(count);
      for (size_t i{0}; i < count; ++i) {
        threads.emplace_back([io{io}] { io->run(); });
      }
    }
    IoThreads(const IoThreads &) = delete;
    IoThreads(IoThreads &&) = delete;
    inline ~IoThreads() {
      work.reset();
      for (auto &thread : threads) {
        if (thread.joinable()) {
          thread.join();
        }
      }
    }
    IoThreads &operator=(const IoThreads &) = delete;
    IoThreads &operator=(IoThreads &&) = delete;

    std::shared_ptr<boost::asio::io_context> io;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
        work;
    std::vector<std::thread> threads;
  };
}  // namespace scv
