/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/compiler_version/compiler_version.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <vector>

namespace scv::primitives {
  namespace {
    bool isIdentifier(std::string_view str) {
      if (str.empty()) {
        return false;
      }
      std::vector<std::string> parts;
      boost::algorithm::split(parts, str, boost::algorithm::is_any_of("."));
      for (const auto &part : parts) {
        if (part.empty()
            || !std::all_of(part.begin(), part.end(), [](char c) {
                 return std::isalnum(static_cast<unsigned char>(c)) != 0
                        || c == '-';
               })) {
          return false;
        }
      }
      return true;
    }

    outcome::result<uint64_t> parseNumber(std::string_view str) {
      uint64_t value{};
      const auto *end{str.data() + str.size()};
      const auto [ptr, ec]{std::from_chars(str.data(), end, value)};
      if (str.empty() || ec != std::errc{} || ptr != end
          || (str.size() > 1 && str[0] == '0')) {
        return CompilerVersionError::kInvalidFormat;
      }
      return value;
    }
  }  // namespace

  outcome::result<CompilerVersion> CompilerVersion::fromString(
      std::string_view str) {
    CompilerVersion version;
    if (!str.empty() && str[0] == 'v') {
      str.remove_prefix(1);
    }
    if (const auto plus{str.find('+')}; plus != std::string_view::npos) {
      version.build = str.substr(plus + 1);
      if (!isIdentifier(version.build)) {
        return CompilerVersionError::kInvalidFormat;
      }
      str = str.substr(0, plus);
    }
    if (const auto dash{str.find('-')}; dash != std::string_view::npos) {
      version.pre_release = str.substr(dash + 1);
      if (!isIdentifier(version.pre_release)) {
        return CompilerVersionError::kInvalidFormat;
      }
      str = str.substr(0, dash);
    }
    std::vector<std::string> numbers;
    boost::algorithm::split(numbers, str, boost::algorithm::is_any_of("."));
    if (numbers.size() != 3) {
      return CompilerVersionError::kInvalidFormat;
    }
    OUTCOME_TRYA(version.major, parseNumber(numbers[0]));
    OUTCOME_TRYA(version.minor, parseNumber(numbers[1]));
    OUTCOME_TRYA(version.patch, parseNumber(numbers[2]));
    return version;
  }

  std::string CompilerVersion::toString() const {
    std::string str{build.empty() ? "" : "v"};
    str += std::to_string(major) + "." + std::to_string(minor) + "."
           + std::to_string(patch);
    if (!pre_release.empty()) {
      str += "-" + pre_release;
    }
    if (!build.empty()) {
      str += "+" + build;
    }
    return str;
  }

  bool operator<(const CompilerVersion &l, const CompilerVersion &r) {
    if (std::tie(l.major, l.minor, l.patch)
        != std::tie(r.major, r.minor, r.patch)) {
      return std::tie(l.major, l.minor, l.patch)
             < std::tie(r.major, r.minor, r.patch);
    }
    if (l.pre_release.empty() != r.pre_release.empty()) {
      return !l.pre_release.empty();
    }
    return std::tie(l.pre_release, l.build) < std::tie(r.pre_release, r.build);
  }
}  // namespace scv::primitives

OUTCOME_CPP_DEFINE_CATEGORY(scv::primitives, CompilerVersionError, e) {
  using E = scv::primitives::CompilerVersionError;
  switch (e) {
    case E::kInvalidFormat:
      return "CompilerVersion: invalid version format";
  }
  return "CompilerVersion: unknown error";
}
