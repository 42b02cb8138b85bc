/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <cerrno>
#include <cstdlib>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace scv::codec::json {
  using rapidjson::StringBuffer;

  outcome::result<Document> parse(std::string_view input) {
    Document doc;
    doc.Parse(input.data(), input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  std::string format(JIn j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    j->Accept(writer);
    return {buffer.GetString(), buffer.GetSize()};
  }

  outcome::result<JIn> jGet(JIn j, std::string_view key) {
    if (!j->IsObject()) {
      return JsonError::kWrongType;
    }
    const Value name{rapidjson::StringRef(
        key.data(), static_cast<rapidjson::SizeType>(key.size()))};
    auto it{j->FindMember(name)};
    if (it == j->MemberEnd()) {
      return JsonError::kMissingField;
    }
    return &it->value;
  }

  boost::optional<JIn> jGetOpt(JIn j, std::string_view key) {
    if (auto member{jGet(j, key)}) {
      if (!member.value()->IsNull()) {
        return member.value();
      }
    }
    return boost::none;
  }

  outcome::result<std::string_view> jStr(JIn j) {
    if (j->IsString()) {
      return std::string_view{j->GetString(), j->GetStringLength()};
    }
    return JsonError::kWrongType;
  }

  outcome::result<uint64_t> jUint(JIn j) {
    if (j->IsUint64()) {
      return j->GetUint64();
    }
    if (j->IsString()) {
      const std::string str{j->GetString(), j->GetStringLength()};
      if (str.empty()
          || str.find_first_not_of("0123456789") != std::string::npos) {
        return JsonError::kWrongType;
      }
      errno = 0;
      const auto value{strtoull(str.c_str(), nullptr, 10)};
      if (errno == ERANGE) {
        return JsonError::kOutOfRange;
      }
      return value;
    }
    if (j->IsNumber()) {
      return JsonError::kOutOfRange;
    }
    return JsonError::kWrongType;
  }

  outcome::result<bool> jBool(JIn j) {
    if (j->IsBool()) {
      return j->GetBool();
    }
    return JsonError::kWrongType;
  }

  outcome::result<std::map<std::string, std::string>> jStrMap(JIn j) {
    std::map<std::string, std::string> map;
    OUTCOME_TRY(jObject(j, [&](auto key, auto value) -> outcome::result<void> {
      OUTCOME_TRY(str, jStr(value));
      map.emplace(key, str);
      return outcome::success();
    }));
    return map;
  }
}  // namespace scv::codec::json
