/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/transfer/transfer_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mk::markets::storage, TransferError, e) {
  using E = mk::markets::storage::TransferError;
  switch (e) {
    case E::kUnsupportedTransferType:
      return "TransferError: cannot parse params for unrecognized transfer "
             "type";
    case E::kTransferParamsInvalid:
      return "TransferError: failed to de-serialize transport params bytes";
    case E::kTransferUrlInvalid:
      return "TransferError: cannot parse url";
    case E::kAddressResolution:
      return "TransferError: cannot get host from multiaddr";
  }
  return "TransferError: unknown error";
}
