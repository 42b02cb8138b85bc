/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <boost/optional.hpp>
#include <map>
#include <string_view>

#include "codec/json/json_errors.hpp"
#include "common/outcome.hpp"

namespace scv::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using Allocator = rapidjson::MemoryPoolAllocator<>;
  using JIn = const Value *;

  outcome::result<Document> parse(std::string_view input);

  /**
   * Compact serialization, object members are written in insertion order
   */
  std::string format(JIn j);

  outcome::result<JIn> jGet(JIn j, std::string_view key);

  /**
   * Optional member, null value is same as missing
   */
  boost::optional<JIn> jGetOpt(JIn j, std::string_view key);

  outcome::result<std::string_view> jStr(JIn j);

  /**
   * Accepts json number or decimal string
   */
  outcome::result<uint64_t> jUint(JIn j);

  outcome::result<bool> jBool(JIn j);

  /**
   * Decodes object of strings
   */
  outcome::result<std::map<std::string, std::string>> jStrMap(JIn j);

  /**
   * Visits object members in document order
   * @param f - called with member name and value, returns result<void>
   */
  template <typename F>
  outcome::result<void> jObject(JIn j, const F &f) {
    if (!j->IsObject()) {
      return JsonError::kWrongType;
    }
    for (const auto &it : j->GetObject()) {
      OUTCOME_TRY(f(std::string_view{it.name.GetString(),
                                      it.name.GetStringLength()},
                    &it.value));
    }
    return outcome::success();
  }

  inline Value jString(std::string_view s, Allocator &allocator) {
    return {s.data(), static_cast<rapidjson::SizeType>(s.size()), allocator};
  }

  inline void jSet(Value &j,
                   std::string_view key,
                   Value &&value,
                   Allocator &allocator) {
    j.AddMember(jString(key, allocator), value, allocator);
  }
}  // namespace scv::codec::json
