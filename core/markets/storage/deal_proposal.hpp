/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "codec/cbor/streams_annotation.hpp"
#include "crypto/signature/signature.hpp"
#include "primitives/address/address_codec.hpp"
#include "primitives/cid/cid.hpp"
#include "primitives/piece/piece.hpp"
#include "primitives/types.hpp"

namespace mk::markets::storage {
  using crypto::signature::Signature;
  using primitives::ChainEpoch;
  using primitives::DealId;
  using primitives::EpochDuration;
  using primitives::TokenAmount;
  using primitives::address::Address;
  using primitives::piece::PaddedPieceSize;

  /**
   * On-chain terms of a storage deal
   */
  struct DealProposal {
    inline TokenAmount clientBalanceRequirement() const {
      return client_collateral + getTotalStorageFee();
    }

    inline TokenAmount providerBalanceRequirement() const {
      return provider_collateral;
    }

    inline EpochDuration duration() const {
      return end_epoch - start_epoch;
    }

    inline TokenAmount getTotalStorageFee() const {
      return storage_price_per_epoch * duration();
    }

    CID piece_cid;
    PaddedPieceSize piece_size;
    bool verified = false;
    Address client;
    Address provider;
    std::string label;
    ChainEpoch start_epoch{};
    ChainEpoch end_epoch{};
    TokenAmount storage_price_per_epoch;
    TokenAmount provider_collateral;
    TokenAmount client_collateral;

    inline bool operator==(const DealProposal &other) const {
      return piece_cid == other.piece_cid && piece_size == other.piece_size
             && verified == other.verified && client == other.client
             && provider == other.provider && label == other.label
             && start_epoch == other.start_epoch && end_epoch == other.end_epoch
             && storage_price_per_epoch == other.storage_price_per_epoch
             && provider_collateral == other.provider_collateral
             && client_collateral == other.client_collateral;
    }

    inline bool operator!=(const DealProposal &other) const {
      return !(*this == other);
    }
  };
  CBOR_TUPLE(DealProposal,
             piece_cid,
             piece_size,
             verified,
             client,
             provider,
             label,
             start_epoch,
             end_epoch,
             storage_price_per_epoch,
             provider_collateral,
             client_collateral)

  /** Proposal with client signature */
  struct ClientDealProposal {
    DealProposal proposal;
    Signature client_signature;

    inline bool operator==(const ClientDealProposal &other) const {
      return proposal == other.proposal
             && client_signature == other.client_signature;
    }
  };
  CBOR_TUPLE(ClientDealProposal, proposal, client_signature)

  struct DealSchedule {
    ChainEpoch start_epoch{};
    ChainEpoch end_epoch{};
  };

  /** Deal a piece is added to sector for */
  struct PieceDealInfo {
    boost::optional<CID> publish_cid;
    DealId deal_id{};
    boost::optional<DealProposal> deal_proposal;
    DealSchedule deal_schedule;
    bool keep_unsealed{};
  };

  struct PublishDealsWaitResult {
    DealId deal_id{};
    /** Cid of message that landed on chain, may differ from published one */
    CID final_cid;
  };
}  // namespace mk::markets::storage
