/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/ask.hpp"

namespace mk::markets::storage::provider {
  class AskGetter {
   public:
    virtual ~AskGetter() = default;

    /** Current signed ask of provider */
    virtual SignedStorageAsk getAsk() = 0;
  };
}  // namespace mk::markets::storage::provider
