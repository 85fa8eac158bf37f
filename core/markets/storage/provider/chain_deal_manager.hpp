/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/deal_proposal.hpp"

namespace mk::markets::storage::provider {
  class ChainDealManager {
   public:
    virtual ~ChainDealManager() = default;

    /**
     * Waits until publish message lands on chain and finds deal id of the
     * proposal
     */
    virtual outcome::result<PublishDealsWaitResult> waitForPublishDeals(
        const CID &publish_cid, const DealProposal &proposal) = 0;
  };
}  // namespace mk::markets::storage::provider
