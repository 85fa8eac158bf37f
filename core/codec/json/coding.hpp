/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/algorithm/string/predicate.hpp>

#include "codec/json/basic_coding.hpp"

namespace mk::codec::json {

  inline void Set(Value &j,
                  std::string_view key,
                  Value &&value,
                  rapidjson::MemoryPoolAllocator<> &allocator) {
    j.AddMember(encode(key, allocator), value, allocator);
  }

  template <typename T>
  inline void Set(Value &j,
                  std::string_view key,
                  const T &v,
                  rapidjson::MemoryPoolAllocator<> &allocator) {
    Set(j, key, encode(v, allocator), allocator);
  }

  /**
   * Finds member by exact name, otherwise by case-insensitive name
   * @return nullptr if there is no such member
   */
  inline const Value *FindCaseless(const Value &j, std::string_view key) {
    if (!j.IsObject()) {
      outcome::raise(JsonError::kWrongType);
    }
    const Value *found{nullptr};
    for (auto it = j.MemberBegin(); it != j.MemberEnd(); ++it) {
      std::string_view name{it->name.GetString(), it->name.GetStringLength()};
      if (name == key) {
        return &it->value;
      }
      if (!found && boost::algorithm::iequals(name, key)) {
        found = &it->value;
      }
    }
    return found;
  }

  template <typename T>
  inline void GetCaseless(const Value &j, std::string_view key, T &v) {
    auto value{FindCaseless(j, key)};
    if (!value) {
      outcome::raise(JsonError::kOutOfRange);
    }
    decode(v, *value);
  }

  template <typename T>
  inline Document encode(const T &v) {
    Document document;
    static_cast<Value &>(document) = encode(v, document.GetAllocator());
    return document;
  }

  template <typename T>
  inline T innerDecode(const Value &j) {
    T v{};
    decode(v, j);
    return v;
  }

  template <typename T>
  inline outcome::result<T> decode(const Value &j) {
    try {
      return innerDecode<T>(j);
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
  }
}  // namespace mk::codec::json
