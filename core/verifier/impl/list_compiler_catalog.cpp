/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "verifier/impl/list_compiler_catalog.hpp"

#include <algorithm>
#include <boost/filesystem/operations.hpp>

#include "common/logger.hpp"
#include "verifier/verification_error.hpp"

namespace scv::verifier {
  namespace fs = boost::filesystem;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("catalog");
      return logger.get();
    }
  }  // namespace

  ListCompilerCatalog::ListCompilerCatalog(
      std::vector<CompilerVersion> versions)
      : versions_{std::move(versions)} {
    std::sort(versions_.begin(),
              versions_.end(),
              [](const auto &l, const auto &r) { return r < l; });
    versions_.erase(std::unique(versions_.begin(), versions_.end()),
                    versions_.end());
  }

  outcome::result<std::shared_ptr<ListCompilerCatalog>>
  ListCompilerCatalog::fromDirectory(const fs::path &dir) {
    boost::system::error_code ec;
    if (!fs::is_directory(dir, ec)) {
      log()->error("compilers directory {} not found", dir.string());
      return CompilerCatalogError::kDirectoryNotFound;
    }
    fs::directory_iterator entries{dir, ec};
    if (ec) {
      log()->error("compilers directory {}: {}", dir.string(), ec.message());
      return CompilerCatalogError::kDirectoryNotFound;
    }
    std::vector<CompilerVersion> versions;
    for (const auto &entry : entries) {
      const auto name{entry.path().filename().string()};
      if (auto version{CompilerVersion::fromString(name)}) {
        versions.push_back(std::move(version.value()));
      } else {
        log()->debug("skip {}, not a compiler version", name);
      }
    }
    log()->info("{} compilers found in {}", versions.size(), dir.string());
    return std::make_shared<ListCompilerCatalog>(std::move(versions));
  }

  outcome::result<CompilerVersion> ListCompilerCatalog::resolve(
      std::string_view version) const {
    OUTCOME_TRY(parsed, CompilerVersion::fromString(version));
    if (!contains(parsed)) {
      return VerificationError::kVersionNotFound;
    }
    return parsed;
  }

  bool ListCompilerCatalog::contains(const CompilerVersion &version) const {
    return std::find(versions_.begin(), versions_.end(), version)
           != versions_.end();
  }

  const std::vector<CompilerVersion> &ListCompilerCatalog::versions() const {
    return versions_;
  }
}  // namespace scv::verifier

OUTCOME_CPP_DEFINE_CATEGORY(scv::verifier, CompilerCatalogError, e) {
  using E = scv::verifier::CompilerCatalogError;
  switch (e) {
    case E::kDirectoryNotFound:
      return "CompilerCatalogError: compilers directory not found";
  }
  return "CompilerCatalogError: unknown error";
}
