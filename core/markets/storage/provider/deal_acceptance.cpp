/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/provider/deal_acceptance.hpp"

#include <boost/uuid/uuid_io.hpp>

namespace mk::markets::storage::provider {
  DealAcceptance::DealAcceptance(std::shared_ptr<AskGetter> asks)
      : asks_{std::move(asks)},
        logger_{common::createLogger("deal_acceptance")} {}

  DealResponse DealAcceptance::check(const DealParams &params) {
    if (auto valid{validate(params)}; !valid) {
      logger_->debug("rejecting deal {}: {}",
                     boost::uuids::to_string(params.deal_uuid),
                     valid.error().message());
      return DealResponse::reject(valid.error().message());
    }
    return DealResponse::accept();
  }

  outcome::result<void> DealAcceptance::validate(const DealParams &params) {
    OUTCOME_TRY(params.validate());
    const auto &proposal{params.client_deal_proposal.proposal};
    OUTCOME_TRY(proposal.piece_size.validate());
    if (proposal.duration() <= 0) {
      return DealAcceptanceError::kInvalidDuration;
    }
    const auto ask{asks_->getAsk().ask};
    if (proposal.provider != ask.miner) {
      return DealAcceptanceError::kWrongProvider;
    }
    OUTCOME_TRY(checkAskCompatible(ask, proposal));
    return outcome::success();
  }
}  // namespace mk::markets::storage::provider

OUTCOME_CPP_DEFINE_CATEGORY(mk::markets::storage::provider,
                            DealAcceptanceError,
                            e) {
  using E = mk::markets::storage::provider::DealAcceptanceError;
  switch (e) {
    case E::kWrongProvider:
      return "DealAcceptanceError: incorrect provider for deal";
    case E::kInvalidDuration:
      return "DealAcceptanceError: deal end epoch must be after start epoch";
  }
  return "DealAcceptanceError: unknown error";
}
