/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/mk_protocol.hpp"

namespace mk::markets::storage {
  outcome::result<void> DealParams::validate() const {
    if (is_offline) {
      if (!transfer.isZero()) {
        return DealParamsError::kOfflineDealWithTransfer;
      }
      return outcome::success();
    }
    if (!transferTypeFromTag(transfer.type)) {
      return DealParamsError::kUnsupportedTransferType;
    }
    return outcome::success();
  }

  DealParams DealParamsV120::toDealParams() const {
    DealParams params;
    params.deal_uuid = deal_uuid;
    params.is_offline = is_offline;
    params.client_deal_proposal = client_deal_proposal;
    params.deal_data_root = deal_data_root;
    params.transfer = transfer;
    params.remove_unsealed_copy = remove_unsealed_copy;
    params.skip_ipni_announce = false;
    return params;
  }

  DealResponse DealResponse::accept() {
    return {true, {}};
  }

  DealResponse DealResponse::reject(std::string reason) {
    if (reason.empty()) {
      reason = "deal proposal rejected";
    }
    return {false, std::move(reason)};
  }
}  // namespace mk::markets::storage

OUTCOME_CPP_DEFINE_CATEGORY(mk::markets::storage, DealParamsError, e) {
  using E = mk::markets::storage::DealParamsError;
  switch (e) {
    case E::kOfflineDealWithTransfer:
      return "DealParamsError: offline deal must not have transfer";
    case E::kUnsupportedTransferType:
      return "DealParamsError: unsupported transfer type";
  }
  return "DealParamsError: unknown error";
}
