/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace mk::markets::storage::provider {
  enum class DealStatusError {
    kDealNotFound = 1,
    kDealLookupFailed,
    kSignatureVerificationFailed,
    kInvalidSignature,
    kSectorStatusFailed,
  };
}  // namespace mk::markets::storage::provider

OUTCOME_HPP_DECLARE_ERROR(mk::markets::storage::provider, DealStatusError);
