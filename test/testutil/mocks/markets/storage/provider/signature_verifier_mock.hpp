/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/provider/signature_verifier.hpp"

#include <gmock/gmock.h>

namespace mk::markets::storage::provider {

  class SignatureVerifierMock : public SignatureVerifier {
   public:
    MOCK_METHOD3(verifySignature,
                 outcome::result<bool>(const Signature &,
                                       const Address &,
                                       BytesIn));
  };

}  // namespace mk::markets::storage::provider
