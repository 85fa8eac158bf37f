/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <boost/variant.hpp>

#include "codec/cbor/streams_annotation.hpp"
#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "common/visitor.hpp"

namespace mk::crypto::signature {
  enum class SignatureError {
    kInvalidSignatureLength = 1,
    kWrongSignatureType,
  };
}  // namespace mk::crypto::signature

OUTCOME_HPP_DECLARE_ERROR(mk::crypto::signature, SignatureError);

namespace mk::crypto::signature {
  using BlsSignature = std::array<uint8_t, 96>;
  using Secp256k1Signature = std::array<uint8_t, 65>;

  enum Type : uint8_t {
    kUndefined = 0x0,
    kSecp256k1 = 0x1,
    kBls = 0x2,
  };

  /**
   * Signature of secp256k1 or BLS key.
   * Binary form is type byte followed by signature bytes.
   */
  struct Signature : public boost::variant<BlsSignature, Secp256k1Signature> {
    using variant::variant;
    using base_type = boost::variant<BlsSignature, Secp256k1Signature>;

    inline bool operator==(const Signature &other) const {
      return base_type::operator==(static_cast<const base_type &>(other));
    }

    inline bool isBls() const {
      return visit_in_place(
          *this,
          [](const BlsSignature &) { return true; },
          [](const auto &) { return false; });
    }

    Bytes toBytes() const;
    static outcome::result<Signature> fromBytes(BytesIn input);
  };

  CBOR_ENCODE(Signature, signature) {
    return s << signature.toBytes();
  }

  CBOR_DECODE(Signature, signature) {
    Bytes data;
    s >> data;
    OUTCOME_EXCEPT(sig, Signature::fromBytes(data));
    signature = std::move(sig);
    return s;
  }
}  // namespace mk::crypto::signature
