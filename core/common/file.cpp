/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/file.hpp"

#include <fstream>

namespace scv::common {
  outcome::result<std::string> readFile(const boost::filesystem::path &path) {
    std::ifstream file{path.c_str(), std::ios::binary | std::ios::ate};
    if (file.good()) {
      std::string result;
      result.resize(file.tellg());
      file.seekg(0, std::ios::beg);
      if (file.read(result.data(), static_cast<std::streamsize>(result.size()))
              .good()
          || result.empty()) {
        return result;
      }
    }
    return FileError::kCannotRead;
  }
}  // namespace scv::common

OUTCOME_CPP_DEFINE_CATEGORY(scv::common, FileError, e) {
  using E = scv::common::FileError;
  switch (e) {
    case E::kCannotRead:
      return "FileError: cannot read file";
  }
  return "FileError: unknown error";
}
