/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/mk_protocol.hpp"

namespace mk::markets::storage {
  const libp2p::peer::Protocol kDealStatusProtocolId_v1_2_0{
      "/fil/storage/status/1.2.0"};

  /**
   * Deal status query signed by deal client
   */
  struct DealStatusRequest {
    DealUuid deal_uuid{};
    Signature signature;

    /** Signed bytes, raw bytes of deal uuid */
    Bytes getDigest() const {
      return {deal_uuid.begin(), deal_uuid.end()};
    }
  };

  inline CBOR2_ENCODE(DealStatusRequest) {
    auto m{CborEncodeStream::map()};
    m["DealUUID"] << v.deal_uuid;
    m["Signature"] << v.signature;
    return s << m;
  }

  inline CBOR2_DECODE(DealStatusRequest) {
    auto m{s.map()};
    CborDecodeStream::named(m, "DealUUID") >> v.deal_uuid;
    CborDecodeStream::named(m, "Signature") >> v.signature;
    return s;
  }

  /**
   * Snapshot of deal state
   */
  struct DealStatus {
    /** Non-empty if deal is in error state */
    std::string error;
    /** Name of deal checkpoint */
    std::string status;
    std::string sealing_status;
    DealProposal proposal;
    CID signed_proposal_cid;
    /** Set once deal reached publish stage */
    boost::optional<CID> publish_cid;
    DealId chain_deal_id{};
  };

  inline CBOR2_ENCODE(DealStatus) {
    auto m{CborEncodeStream::map()};
    m["Error"] << v.error;
    m["Status"] << v.status;
    m["SealingStatus"] << v.sealing_status;
    m["Proposal"] << v.proposal;
    m["SignedProposalCid"] << v.signed_proposal_cid;
    m["PublishCid"] << v.publish_cid;
    m["ChainDealID"] << v.chain_deal_id;
    return s << m;
  }

  inline CBOR2_DECODE(DealStatus) {
    auto m{s.map()};
    CborDecodeStream::named(m, "Error") >> v.error;
    CborDecodeStream::named(m, "Status") >> v.status;
    CborDecodeStream::named(m, "SealingStatus") >> v.sealing_status;
    CborDecodeStream::named(m, "Proposal") >> v.proposal;
    CborDecodeStream::named(m, "SignedProposalCid") >> v.signed_proposal_cid;
    CborDecodeStream::named(m, "PublishCid") >> v.publish_cid;
    CborDecodeStream::named(m, "ChainDealID") >> v.chain_deal_id;
    return s;
  }

  struct DealStatusResponse {
    DealUuid deal_uuid{};
    /** Non-empty if status can't be returned, e.g. invalid signature */
    std::string error;
    /** Absent when error is set */
    boost::optional<DealStatus> deal_status;
    bool is_offline{};
    uint64_t transfer_size{};
    uint64_t n_bytes_received{};
  };

  inline CBOR2_ENCODE(DealStatusResponse) {
    auto m{CborEncodeStream::map()};
    m["DealUUID"] << v.deal_uuid;
    m["Error"] << v.error;
    m["DealStatus"] << v.deal_status;
    m["IsOffline"] << v.is_offline;
    m["TransferSize"] << v.transfer_size;
    m["NBytesReceived"] << v.n_bytes_received;
    return s << m;
  }

  inline CBOR2_DECODE(DealStatusResponse) {
    auto m{s.map()};
    CborDecodeStream::named(m, "DealUUID") >> v.deal_uuid;
    CborDecodeStream::named(m, "Error") >> v.error;
    CborDecodeStream::named(m, "DealStatus") >> v.deal_status;
    CborDecodeStream::named(m, "IsOffline") >> v.is_offline;
    CborDecodeStream::named(m, "TransferSize") >> v.transfer_size;
    CborDecodeStream::named(m, "NBytesReceived") >> v.n_bytes_received;
    return s;
  }
}  // namespace mk::markets::storage
