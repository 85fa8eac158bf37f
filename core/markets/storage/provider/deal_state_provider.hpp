/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/provider/provider_deal_state.hpp"

namespace mk::markets::storage::provider {
  /**
   * Owner of provider deal states
   */
  class DealStateProvider {
   public:
    virtual ~DealStateProvider() = default;

    /**
     * @return DealStatusError::kDealNotFound for unknown deal
     */
    virtual outcome::result<ProviderDealState> getDeal(
        const DealUuid &deal_uuid) = 0;

    /** Bytes of deal data received so far */
    virtual uint64_t bytesReceived(const DealUuid &deal_uuid) = 0;

    /** Sealing status of sector the deal is in */
    virtual outcome::result<std::string> sealingStatus(
        const ProviderDealState &deal) = 0;
  };
}  // namespace mk::markets::storage::provider
