/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/logger.hpp"
#include "markets/storage/provider/deal_state_provider.hpp"
#include "markets/storage/provider/signature_verifier.hpp"
#include "markets/storage/status_protocol.hpp"

namespace mk::markets::storage::provider {

  /**
   * Answers deal status requests of deal clients.
   * Request must be signed by the client of the deal.
   */
  class DealStatusResponder {
   public:
    DealStatusResponder(std::shared_ptr<DealStateProvider> deals,
                        std::shared_ptr<SignatureVerifier> verifier);

    /**
     * Never fails, error is reported in DealStatusResponse::error and
     * DealStatusResponse::deal_status is not set then
     */
    DealStatusResponse respond(const DealStatusRequest &request);

   private:
    outcome::result<DealStatusResponse> getDealStatus(
        const DealStatusRequest &request);

    std::shared_ptr<DealStateProvider> deals_;
    std::shared_ptr<SignatureVerifier> verifier_;
    common::Logger logger_;
  };

}  // namespace mk::markets::storage::provider
