/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include "codec/cbor/cbor_errors.hpp"
#include "codec/cbor/streams_annotation.hpp"
#include "common/bytes.hpp"

namespace mk::primitives {
  using BigInt = boost::multiprecision::cpp_int;
}  // namespace mk::primitives

namespace boost::multiprecision {
  /** Sign byte followed by big-endian magnitude, empty for zero */
  CBOR_ENCODE(cpp_int, big_int) {
    mk::Bytes bytes;
    if (big_int != 0) {
      bytes.push_back(big_int < 0 ? 1 : 0);
      export_bits(big_int, std::back_inserter(bytes), 8);
    }
    return s << bytes;
  }

  CBOR_DECODE(cpp_int, big_int) {
    mk::Bytes bytes;
    s >> bytes;
    if (bytes.empty()) {
      big_int = 0;
    } else {
      if (bytes[0] > 1) {
        mk::outcome::raise(mk::codec::cbor::CborDecodeError::kInvalidCbor);
      }
      import_bits(big_int, bytes.begin() + 1, bytes.end());
      if (bytes[0] == 1) {
        big_int = -big_int;
      }
    }
    return s;
  }
}  // namespace boost::multiprecision
