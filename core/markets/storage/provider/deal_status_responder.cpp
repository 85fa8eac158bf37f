/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/provider/deal_status_responder.hpp"

#include <boost/uuid/uuid_io.hpp>

#include "markets/storage/provider/deal_status_error.hpp"

namespace mk::markets::storage::provider {

  DealStatusResponder::DealStatusResponder(
      std::shared_ptr<DealStateProvider> deals,
      std::shared_ptr<SignatureVerifier> verifier)
      : deals_{std::move(deals)},
        verifier_{std::move(verifier)},
        logger_{common::createLogger("deal_status")} {}

  DealStatusResponse DealStatusResponder::respond(
      const DealStatusRequest &request) {
    auto response{getDealStatus(request)};
    if (response) {
      return std::move(response.value());
    }

    DealStatusResponse failure;
    failure.deal_uuid = request.deal_uuid;
    if (response.error() == DealStatusError::kDealNotFound) {
      failure.error = "no storage deal found with deal UUID "
                      + boost::uuids::to_string(request.deal_uuid);
    } else {
      failure.error = response.error().message();
    }
    return failure;
  }

  outcome::result<DealStatusResponse> DealStatusResponder::getDealStatus(
      const DealStatusRequest &request) {
    const auto uuid{boost::uuids::to_string(request.deal_uuid)};

    auto deal_res{deals_->getDeal(request.deal_uuid)};
    if (!deal_res) {
      if (deal_res.error() == DealStatusError::kDealNotFound) {
        logger_->debug("status request for unknown deal {}", uuid);
        return DealStatusError::kDealNotFound;
      }
      logger_->warn(
          "getting deal {} failed: {}", uuid, deal_res.error().message());
      return DealStatusError::kDealLookupFailed;
    }
    auto &deal{deal_res.value()};

    const auto &client{deal.client_deal_proposal.proposal.client};
    auto verified{verifier_->verifySignature(
        request.signature, client, request.getDigest())};
    if (!verified) {
      logger_->warn("verifying status request signature of deal {} failed: {}",
                    uuid,
                    verified.error().message());
      return DealStatusError::kSignatureVerificationFailed;
    }
    if (!verified.value()) {
      logger_->debug("invalid status request signature of deal {}", uuid);
      return DealStatusError::kInvalidSignature;
    }

    auto sealing_status{deals_->sealingStatus(deal)};
    if (!sealing_status) {
      logger_->warn("getting sector {} status of deal {} failed: {}",
                    deal.sector_id,
                    uuid,
                    sealing_status.error().message());
      return DealStatusError::kSectorStatusFailed;
    }

    DealStatusResponse response;
    response.deal_uuid = request.deal_uuid;
    response.is_offline = deal.is_offline;
    response.transfer_size = deal.transfer.size;
    response.n_bytes_received = deals_->bytesReceived(request.deal_uuid);

    DealStatus status;
    status.error = deal.err;
    status.status = std::string{checkpointName(deal.checkpoint)};
    status.sealing_status = std::move(sealing_status.value());
    status.proposal = deal.client_deal_proposal.proposal;
    status.signed_proposal_cid = deal.signed_proposal_cid;
    status.publish_cid = deal.publish_cid;
    status.chain_deal_id = deal.chain_deal_id;
    response.deal_status = std::move(status);
    return response;
  }

}  // namespace mk::markets::storage::provider
