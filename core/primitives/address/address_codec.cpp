/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address_codec.hpp"

#include <libp2p/multi/uvarint.hpp>

#include "common/visitor.hpp"

namespace mk::primitives::address {
  using libp2p::multi::UVarint;

  namespace {
    template <typename T>
    outcome::result<Address> decodeHash(BytesIn payload) {
      T hash{};
      if (static_cast<size_t>(payload.size()) != hash.size()) {
        return AddressError::kInvalidPayload;
      }
      std::copy(payload.begin(), payload.end(), hash.begin());
      return Address{hash};
    }

    outcome::result<Address> decode(Protocol protocol, BytesIn payload) {
      switch (protocol) {
        case Protocol::ID: {
          if (auto value{UVarint::create(payload)}) {
            if (static_cast<ptrdiff_t>(value->size()) == payload.size()) {
              return Address{value->toUInt64()};
            }
          }
          return AddressError::kInvalidPayload;
        }
        case Protocol::SECP256K1:
          return decodeHash<Secp256k1PublicKeyHash>(payload);
        case Protocol::ACTOR:
          return decodeHash<ActorExecHash>(payload);
        case Protocol::BLS:
          return decodeHash<BLSPublicKeyHash>(payload);
      }
      return AddressError::kUnknownProtocol;
    }
  }  // namespace

  Bytes encode(const Address &address) {
    Bytes res;
    res.push_back(address.getProtocol());
    visit_in_place(
        address.data,
        [&](ActorId v) { append(res, UVarint{v}.toVector()); },
        [&](const auto &v) { append(res, v); });
    return res;
  }

  outcome::result<Address> decode(BytesIn v) {
    if (v.empty()) {
      return AddressError::kInvalidPayload;
    }
    return decode(Protocol{v[0]}, v.subspan(1));
  }
}  // namespace mk::primitives::address
