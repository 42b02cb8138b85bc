/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <memory>

#include "verifier/compiler_catalog.hpp"

namespace scv::verifier {
  enum class CompilerCatalogError {
    kDirectoryNotFound = 1,
  };

  /**
   * Catalog of fixed version list, immutable after construction
   */
  class ListCompilerCatalog : public CompilerCatalog {
   public:
    explicit ListCompilerCatalog(std::vector<CompilerVersion> versions);

    /**
     * Catalog of compilers directory, each entry is named after version it
     * holds. Entries with other names are skipped.
     */
    static outcome::result<std::shared_ptr<ListCompilerCatalog>> fromDirectory(
        const boost::filesystem::path &dir);

    outcome::result<CompilerVersion> resolve(
        std::string_view version) const override;

    bool contains(const CompilerVersion &version) const override;

    const std::vector<CompilerVersion> &versions() const override;

   private:
    std::vector<CompilerVersion> versions_;
  };
}  // namespace scv::verifier

OUTCOME_HPP_DECLARE_ERROR(scv::verifier, CompilerCatalogError);
