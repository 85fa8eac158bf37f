/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uri_parser/percent_encoding.hpp"

#include <iomanip>
#include <sstream>

namespace mk::common {
  namespace {
    // unreserved
    const std::string_view kUnreserved{
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789"
        "-_.~"};

    // kept in path
    const std::string_view kPathSymbols{"$&+,/:;=@"};

    inline bool needEncode(const char c) {
      return kUnreserved.find(c) == std::string_view::npos
             && kPathSymbols.find(c) == std::string_view::npos;
    }

    inline int unhexDigit(const char c) {
      if (c >= '0' && c <= '9') {
        return c - '0';
      }
      if (c >= 'a' && c <= 'f') {
        return 10 + c - 'a';
      }
      if (c >= 'A' && c <= 'F') {
        return 10 + c - 'A';
      }
      return -1;
    }
  }  // namespace

  std::string PercentEncoding::encodePath(std::string_view input) {
    std::ostringstream oss;
    for (const auto c : input) {
      if (needEncode(c)) {
        oss << '%' << std::uppercase << std::setfill('0') << std::setw(2)
            << std::hex << static_cast<int>(static_cast<uint8_t>(c));
      } else {
        oss.put(c);
      }
    }
    return oss.str();
  }

  outcome::result<std::string> PercentEncoding::decode(std::string_view input) {
    std::string result;
    result.reserve(input.size());
    for (size_t i = 0; i < input.size(); ++i) {
      if (input[i] != '%') {
        result.push_back(input[i]);
        continue;
      }
      if (i + 2 >= input.size()) {
        return PercentEncodingError::kTruncatedEscape;
      }
      const auto high = unhexDigit(input[i + 1]);
      const auto low = unhexDigit(input[i + 2]);
      if (high < 0 || low < 0) {
        return PercentEncodingError::kInvalidEscape;
      }
      result.push_back(static_cast<char>((high << 4) | low));
      i += 2;
    }
    return result;
  }
}  // namespace mk::common

OUTCOME_CPP_DEFINE_CATEGORY(mk::common, PercentEncodingError, e) {
  using E = mk::common::PercentEncodingError;
  switch (e) {
    case E::kTruncatedEscape:
      return "PercentEncoding: unexpected end of data in percent-encoded "
             "symbol";
    case E::kInvalidEscape:
      return "PercentEncoding: wrong percent-encoded symbol";
  }
  return "PercentEncoding: unknown error";
}
