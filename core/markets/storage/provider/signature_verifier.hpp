/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "crypto/signature/signature.hpp"
#include "primitives/address/address.hpp"

namespace mk::markets::storage::provider {
  using crypto::signature::Signature;
  using primitives::address::Address;

  class SignatureVerifier {
   public:
    virtual ~SignatureVerifier() = default;

    /**
     * Verifies signature of data by key of address
     * @return false if signature is invalid, error if address can't be
     * resolved to key or signature type doesn't match it
     */
    virtual outcome::result<bool> verifySignature(const Signature &signature,
                                                  const Address &address,
                                                  BytesIn data) = 0;
  };
}  // namespace mk::markets::storage::provider
