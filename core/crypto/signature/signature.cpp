/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/signature/signature.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mk::crypto::signature, SignatureError, e) {
  using mk::crypto::signature::SignatureError;
  switch (e) {
    case (SignatureError::kInvalidSignatureLength):
      return "SignatureError: invalid signature length";
    case (SignatureError::kWrongSignatureType):
      return "SignatureError: wrong signature type";
  }
  return "SignatureError: unknown error";
}

namespace mk::crypto::signature {
  namespace {
    template <typename T>
    outcome::result<Signature> copySignature(BytesIn input) {
      T signature{};
      if (static_cast<size_t>(input.size()) != signature.size()) {
        return SignatureError::kInvalidSignatureLength;
      }
      std::copy(input.begin(), input.end(), signature.begin());
      return Signature{signature};
    }
  }  // namespace

  Bytes Signature::toBytes() const {
    Bytes bytes;
    visit_in_place(
        *this,
        [&](const BlsSignature &v) {
          bytes.push_back(kBls);
          append(bytes, v);
        },
        [&](const Secp256k1Signature &v) {
          bytes.push_back(kSecp256k1);
          append(bytes, v);
        });
    return bytes;
  }

  outcome::result<Signature> Signature::fromBytes(BytesIn input) {
    if (input.empty()) {
      return SignatureError::kInvalidSignatureLength;
    }
    switch (input[0]) {
      case kSecp256k1:
        return copySignature<Secp256k1Signature>(input.subspan(1));
      case kBls:
        return copySignature<BlsSignature>(input.subspan(1));
    }
    return SignatureError::kWrongSignatureType;
  }
}  // namespace mk::crypto::signature
