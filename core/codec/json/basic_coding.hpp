/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <map>
#include <string>

#include "codec/json/json_errors.hpp"
#include "common/outcome.hpp"

#define COMMA ,

#define JSON_ENCODE(type)               \
  inline mk::codec::json::Value encode( \
      const type &v, rapidjson::MemoryPoolAllocator<> &allocator)

// NOLINTNEXTLINE(bugprone-macro-parentheses)
#define JSON_DECODE(type) \
  inline void decode(type &v, const mk::codec::json::Value &j)

namespace mk::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;

  template <typename T>
  T innerDecode(const Value &j);

  template <typename T>
  void Set(Value &j,
           std::string_view key,
           const T &v,
           rapidjson::MemoryPoolAllocator<> &allocator);

  inline std::string AsString(const Value &j) {
    if (!j.IsString()) {
      outcome::raise(JsonError::kWrongType);
    }
    return {j.GetString(), j.GetStringLength()};
  }

  JSON_ENCODE(std::string_view) {
    return {v.data(), static_cast<rapidjson::SizeType>(v.size()), allocator};
  }

  JSON_ENCODE(std::string) {
    return encode(std::string_view{v}, allocator);
  }

  JSON_DECODE(std::string) {
    v = AsString(j);
  }

  template <typename T>
  JSON_ENCODE(std::map<std::string COMMA T>) {
    Value j{rapidjson::kObjectType};
    j.MemberReserve(v.size(), allocator);
    for (const auto &pair : v) {
      Set(j, pair.first, pair.second, allocator);
    }
    return j;
  }

  template <typename T>
  JSON_DECODE(std::map<std::string COMMA T>) {
    if (j.IsNull()) {
      return;
    }
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    for (auto it = j.MemberBegin(); it != j.MemberEnd(); ++it) {
      v.emplace(AsString(it->name), innerDecode<T>(it->value));
    }
  }
}  // namespace mk::codec::json
