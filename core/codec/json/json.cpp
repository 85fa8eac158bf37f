/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace mk::codec::json {
  using rapidjson::StringBuffer;

  outcome::result<Document> parse(std::string_view input) {
    if (input.empty()) {
      return JsonError::kParseError;
    }
    Document doc;
    doc.Parse(input.data(), input.size());
    if (doc.HasParseError()) {
      return JsonError::kParseError;
    }
    return std::move(doc);
  }

  outcome::result<Document> parse(BytesIn input) {
    return parse(bytestr(input));
  }

  Bytes format(const Value &j) {
    StringBuffer buffer;
    rapidjson::Writer<StringBuffer> writer{buffer};
    j.Accept(writer);
    return bytesOf({buffer.GetString(), buffer.GetSize()});
  }
}  // namespace mk::codec::json
