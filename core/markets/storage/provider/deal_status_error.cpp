/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/provider/deal_status_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mk::markets::storage::provider,
                            DealStatusError,
                            e) {
  using E = mk::markets::storage::provider::DealStatusError;
  switch (e) {
    case E::kDealNotFound:
      return "no storage deal found";
    case E::kDealLookupFailed:
      return "failed to fetch deal status";
    case E::kSignatureVerificationFailed:
      return "signature verification failed";
    case E::kInvalidSignature:
      return "invalid signature";
    case E::kSectorStatusFailed:
      return "failed to get sector status";
  }
  return "unknown deal status error";
}
