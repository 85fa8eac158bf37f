/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/json/coding.hpp"
#include "common/bytes.hpp"

namespace mk::codec::json {
  outcome::result<Document> parse(std::string_view input);

  outcome::result<Document> parse(BytesIn input);

  Bytes format(const Value &j);

  /** Encodes value and formats it */
  template <typename T>
  inline Bytes encodeBytes(const T &v) {
    return format(encode(v));
  }

  /** Parses bytes and decodes value */
  template <typename T>
  inline outcome::result<T> decodeBytes(BytesIn input) {
    OUTCOME_TRY(document, parse(input));
    return decode<T>(document);
  }
}  // namespace mk::codec::json
