/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/provider/provider_deal_state.hpp"

namespace mk::markets::storage::provider {
  /**
   * Announces deal content to indexers
   */
  class IndexProvider {
   public:
    virtual ~IndexProvider() = default;

    virtual bool enabled() const = 0;

    /** @return cid of announcement */
    virtual outcome::result<CID> announceDeal(
        const ProviderDealState &deal) = 0;

    virtual void start() = 0;
  };
}  // namespace mk::markets::storage::provider
