/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/mk_protocol.hpp"

namespace mk::markets::storage::provider {
  using primitives::SectorNumber;

  /**
   * Milestones of deal execution
   */
  enum class Checkpoint {
    kAccepted,
    kTransferred,
    kPublished,
    kPublishConfirmed,
    kAddedPiece,
    kIndexedAndAnnounced,
    kComplete,
  };

  /** Stable name of checkpoint, e.g. "PublishConfirmed" */
  std::string_view checkpointName(Checkpoint checkpoint);

  /**
   * Provider side state of deal
   */
  struct ProviderDealState {
    DealUuid deal_uuid{};
    ClientDealProposal client_deal_proposal;
    /** Cid of client proposal with signature */
    CID signed_proposal_cid;
    CID deal_data_root;
    Transfer transfer;
    bool is_offline{};
    Checkpoint checkpoint{};
    /** Non-empty if deal failed */
    std::string err;
    boost::optional<CID> publish_cid;
    DealId chain_deal_id{};
    SectorNumber sector_id{};
    bool remove_unsealed_copy{};
    bool skip_ipni_announce{};
  };
}  // namespace mk::markets::storage::provider
