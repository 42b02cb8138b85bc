/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "common/logger.hpp"

// intentionally here, so users can use fs shortcut
namespace fs = boost::filesystem;

namespace test {

  /**
   * @brief Base test, which involves filesystem. Can be created with given
   * path. Clears path before test and after test.
   */
  struct BaseFS_Test : public ::testing::Test {
    explicit BaseFS_Test(fs::path path);

    ~BaseFS_Test() override;

    /**
     * @brief Delete directory and all containing files
     */
    void clear();

    /**
     * @brief Create testing directory
     */
    void mkdir();

    /**
     * @brief Create subdirectory in test directory
     * @param dirname is a new subdirectory name
     * @return full pathname to the new subdirectory
     */
    fs::path createDir(const fs::path &dirname) const;

    /**
     * @brief create file in test directory
     * @param filename is a name of created file
     * @param content - file text
     * @return full pathname to the new file
     */
    fs::path createFile(const fs::path &filename,
                        const std::string &content = {}) const;

    void SetUp() override;

    void TearDown() override;

   protected:
    fs::path base_path;
    scv::common::Logger logger;
  };

}  // namespace test
