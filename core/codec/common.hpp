/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/bytes.hpp"

namespace mk::codec {
  /** Splits n bytes off the front of input */
  constexpr bool read(BytesIn &out, BytesIn &input, size_t n) {
    if (static_cast<size_t>(input.size()) < n) {
      out = {};
      return false;
    }
    out = input.first(n);
    input = input.subspan(n);
    return true;
  }

  constexpr std::optional<BytesIn> read(BytesIn &input, size_t n) {
    BytesIn out;
    if (read(out, input, n)) {
      return out;
    }
    return {};
  }
}  // namespace mk::codec
