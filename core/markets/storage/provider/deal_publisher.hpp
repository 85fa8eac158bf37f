/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/deal_proposal.hpp"

namespace mk::markets::storage::provider {
  class DealPublisher {
   public:
    virtual ~DealPublisher() = default;

    /**
     * Publishes deal on chain, may batch deals
     * @return cid of publish message
     */
    virtual outcome::result<CID> publish(const ClientDealProposal &deal) = 0;
  };
}  // namespace mk::markets::storage::provider
