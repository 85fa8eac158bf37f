/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace mk::markets::storage {
  enum class TransferError {
    kUnsupportedTransferType = 1,
    kTransferParamsInvalid,
    kTransferUrlInvalid,
    kAddressResolution,
  };
}  // namespace mk::markets::storage

OUTCOME_HPP_DECLARE_ERROR(mk::markets::storage, TransferError);
