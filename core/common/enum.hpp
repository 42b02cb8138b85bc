/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <boost/optional.hpp>
#include <string_view>
#include <type_traits>

namespace scv::common {
  template <typename Enumeration, size_t Number>
  using ConversionTable =
      std::array<std::pair<Enumeration, std::string_view>, Number>;

  /**
   * Enumeration is convertible to string when `class_conversion_table(E &&)`
   * is found by ADL in its namespace
   */
  template <typename T>
  auto &conversion_table() {
    return class_conversion_table(T{});
  }

  /**
   * @brief Convert enum class value to its name from conversion table
   * @return name or none if value is missing in table
   */
  template <typename Enumeration>
  boost::optional<std::string_view> to_string(Enumeration const value) {
    for (auto &[enumerator, str] : conversion_table<Enumeration>()) {
      if (enumerator == value) {
        return str;
      }
    }
    return boost::none;
  }

  /**
   * @brief Convert name from conversion table to enum value, case sensitive
   */
  template <typename Enumeration>
  boost::optional<Enumeration> from_string(const std::string_view value) {
    for (auto &[enumerator, str] : conversion_table<Enumeration>()) {
      if (str == value) {
        return enumerator;
      }
    }
    return boost::none;
  }
}  // namespace scv::common
