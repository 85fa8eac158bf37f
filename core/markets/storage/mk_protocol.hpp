/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/uuid/uuid.hpp>
#include <libp2p/peer/protocol.hpp>

#include "codec/cbor/cbor.hpp"
#include "markets/storage/deal_proposal.hpp"
#include "markets/storage/transfer/transfer.hpp"

namespace boost::uuids {
  /** Uuid is 16 raw bytes */
  CBOR_ENCODE(uuid, v) {
    return s << mk::BytesIn(v.begin(), v.size());
  }

  CBOR_DECODE(uuid, v) {
    return s >> mk::BytesOut(v.begin(), v.size());
  }
}  // namespace boost::uuids

namespace mk::markets::storage {
  using codec::cbor::CborDecodeStream;
  using codec::cbor::CborEncodeStream;

  /** Deal proposal protocol without announce flag */
  const libp2p::peer::Protocol kDealProtocolId_v1_2_0{"/fil/storage/mk/1.2.0"};
  const libp2p::peer::Protocol kDealProtocolId_v1_2_1{"/fil/storage/mk/1.2.1"};

  /** Deal id generated by client */
  using DealUuid = boost::uuids::uuid;

  enum class DealParamsError {
    kOfflineDealWithTransfer = 1,
    kUnsupportedTransferType,
  };

  /**
   * Deal proposal sent by client
   */
  struct DealParams {
    DealUuid deal_uuid{};
    bool is_offline{};
    ClientDealProposal client_deal_proposal;
    CID deal_data_root;
    /** Zero value for offline deal */
    Transfer transfer;
    bool remove_unsealed_copy{};
    bool skip_ipni_announce{};

    /**
     * Checks offline deal has no transfer and online deal has recognized
     * transfer type
     */
    outcome::result<void> validate() const;
  };

  inline CBOR2_ENCODE(DealParams) {
    auto m{CborEncodeStream::map()};
    m["DealUUID"] << v.deal_uuid;
    m["IsOffline"] << v.is_offline;
    m["ClientDealProposal"] << v.client_deal_proposal;
    m["DealDataRoot"] << v.deal_data_root;
    m["Transfer"] << v.transfer;
    m["RemoveUnsealedCopy"] << v.remove_unsealed_copy;
    m["SkipIPNIAnnounce"] << v.skip_ipni_announce;
    return s << m;
  }

  inline CBOR2_DECODE(DealParams) {
    auto m{s.map()};
    CborDecodeStream::named(m, "DealUUID") >> v.deal_uuid;
    CborDecodeStream::named(m, "IsOffline") >> v.is_offline;
    CborDecodeStream::named(m, "ClientDealProposal") >> v.client_deal_proposal;
    CborDecodeStream::named(m, "DealDataRoot") >> v.deal_data_root;
    CborDecodeStream::named(m, "Transfer") >> v.transfer;
    CborDecodeStream::named(m, "RemoveUnsealedCopy") >> v.remove_unsealed_copy;
    CborDecodeStream::named(m, "SkipIPNIAnnounce") >> v.skip_ipni_announce;
    return s;
  }

  /** Proposal of protocol 1.2.0 */
  struct DealParamsV120 {
    DealUuid deal_uuid{};
    bool is_offline{};
    ClientDealProposal client_deal_proposal;
    CID deal_data_root;
    Transfer transfer;
    bool remove_unsealed_copy{};

    /** Announce is not skipped for 1.2.0 proposals */
    DealParams toDealParams() const;
  };

  inline CBOR2_ENCODE(DealParamsV120) {
    auto m{CborEncodeStream::map()};
    m["DealUUID"] << v.deal_uuid;
    m["IsOffline"] << v.is_offline;
    m["ClientDealProposal"] << v.client_deal_proposal;
    m["DealDataRoot"] << v.deal_data_root;
    m["Transfer"] << v.transfer;
    m["RemoveUnsealedCopy"] << v.remove_unsealed_copy;
    return s << m;
  }

  inline CBOR2_DECODE(DealParamsV120) {
    auto m{s.map()};
    CborDecodeStream::named(m, "DealUUID") >> v.deal_uuid;
    CborDecodeStream::named(m, "IsOffline") >> v.is_offline;
    CborDecodeStream::named(m, "ClientDealProposal") >> v.client_deal_proposal;
    CborDecodeStream::named(m, "DealDataRoot") >> v.deal_data_root;
    CborDecodeStream::named(m, "Transfer") >> v.transfer;
    CborDecodeStream::named(m, "RemoveUnsealedCopy") >> v.remove_unsealed_copy;
    return s;
  }

  /**
   * Provider answer to deal proposal
   */
  struct DealResponse {
    bool accepted{};
    /** Reason of rejection, empty if deal was accepted */
    std::string message;

    static DealResponse accept();

    /** Empty reason is replaced with generic one */
    static DealResponse reject(std::string reason);
  };

  inline bool operator==(const DealResponse &lhs, const DealResponse &rhs) {
    return lhs.accepted == rhs.accepted && lhs.message == rhs.message;
  }

  inline CBOR2_ENCODE(DealResponse) {
    auto m{CborEncodeStream::map()};
    m["Accepted"] << v.accepted;
    m["Message"] << v.message;
    return s << m;
  }

  inline CBOR2_DECODE(DealResponse) {
    auto m{s.map()};
    CborDecodeStream::named(m, "Accepted") >> v.accepted;
    CborDecodeStream::named(m, "Message") >> v.message;
    return s;
  }
}  // namespace mk::markets::storage

OUTCOME_HPP_DECLARE_ERROR(mk::markets::storage, DealParamsError);
