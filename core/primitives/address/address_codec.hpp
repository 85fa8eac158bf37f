/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/streams_annotation.hpp"
#include "common/bytes.hpp"
#include "primitives/address/address.hpp"

namespace mk::primitives::address {

  /**
   * @brief Encodes an Address to protocol byte followed by payload, ID
   * payload is unsigned varint
   */
  Bytes encode(const Address &address);

  /**
   * @brief Decodes an Address from an array of bytes
   */
  outcome::result<Address> decode(BytesIn v);

  CBOR_ENCODE(Address, address) {
    return s << encode(address);
  }

  CBOR_DECODE(Address, address) {
    OUTCOME_EXCEPT(decoded, decode(s.template get<Bytes>()));
    address = std::move(decoded);
    return s;
  }

}  // namespace mk::primitives::address
