/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <vector>

#include "common/cmp.hpp"

namespace mk {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;
  template <size_t N>
  using BytesN = std::array<uint8_t, N>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }

  /** Views bytes as chars, no copy */
  inline std::string_view bytestr(BytesIn bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
  }

  /** Views chars as bytes, no copy */
  inline BytesIn cbytes(std::string_view str) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return BytesIn(reinterpret_cast<const uint8_t *>(str.data()), str.size());
  }

  inline Bytes bytesOf(std::string_view str) {
    return {str.begin(), str.end()};
  }
}  // namespace mk

namespace gsl {
  inline bool operator==(const mk::Bytes &l, const mk::BytesIn &r) {
    return mk::BytesIn{l} == r;
  }
  inline bool operator==(const mk::BytesIn &l, const mk::Bytes &r) {
    return l == mk::BytesIn{r};
  }
  MK_OPERATOR_NOT_EQUAL_2(mk::Bytes, mk::BytesIn)
  MK_OPERATOR_NOT_EQUAL_2(mk::BytesIn, mk::Bytes)
}  // namespace gsl
