/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "common/logger.hpp"
#include "markets/storage/mk_protocol.hpp"
#include "markets/storage/provider/ask_getter.hpp"

namespace mk::markets::storage::provider {
  enum class DealAcceptanceError {
    kWrongProvider = 1,
    kInvalidDuration,
  };

  /**
   * Checks deal proposal before any resources are allocated for the deal
   */
  class DealAcceptance {
   public:
    explicit DealAcceptance(std::shared_ptr<AskGetter> asks);

    /**
     * Accepts deal if parameters are consistent, the proposal is addressed to
     * ask miner and matches ask price and piece size bounds
     */
    DealResponse check(const DealParams &params);

   private:
    outcome::result<void> validate(const DealParams &params);

    std::shared_ptr<AskGetter> asks_;
    common::Logger logger_;
  };
}  // namespace mk::markets::storage::provider

OUTCOME_HPP_DECLARE_ERROR(mk::markets::storage::provider, DealAcceptanceError);
