/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/cbor.hpp"
#include "markets/storage/deal_proposal.hpp"

namespace mk::markets::storage {
  using codec::cbor::CborDecodeStream;
  using codec::cbor::CborEncodeStream;

  enum class AskError {
    kNegativePrice = 1,
    kMinPieceSizeAboveMax,
    kInvalidPieceSize,
    kPriceBelowAsk,
    kPieceSizeBelowMin,
    kPieceSizeAboveMax,
  };

  /**
   * StorageAsk defines the parameters by which a miner will choose to accept or
   * reject a deal. Matching the ask is required but not sufficient for the
   * deal to be accepted.
   */
  struct StorageAsk {
    // Price per GiB / Epoch
    TokenAmount price;
    TokenAmount verified_price;
    PaddedPieceSize min_piece_size;
    PaddedPieceSize max_piece_size;
    Address miner;
    ChainEpoch timestamp{};
    ChainEpoch expiry{};
    uint64_t seq_no{};

    /**
     * Checks prices are non-negative, piece sizes are valid and min is not
     * above max
     */
    outcome::result<void> validate() const;
  };

  inline bool operator==(const StorageAsk &lhs, const StorageAsk &rhs) {
    return lhs.price == rhs.price && lhs.verified_price == rhs.verified_price
           && lhs.min_piece_size == rhs.min_piece_size
           && lhs.max_piece_size == rhs.max_piece_size && lhs.miner == rhs.miner
           && lhs.timestamp == rhs.timestamp && lhs.expiry == rhs.expiry
           && lhs.seq_no == rhs.seq_no;
  }

  inline CBOR2_ENCODE(StorageAsk) {
    auto m{CborEncodeStream::map()};
    m["Price"] << v.price;
    m["VerifiedPrice"] << v.verified_price;
    m["MinPieceSize"] << v.min_piece_size;
    m["MaxPieceSize"] << v.max_piece_size;
    m["Miner"] << v.miner;
    m["Timestamp"] << v.timestamp;
    m["Expiry"] << v.expiry;
    m["SeqNo"] << v.seq_no;
    return s << m;
  }

  inline CBOR2_DECODE(StorageAsk) {
    auto m{s.map()};
    CborDecodeStream::named(m, "Price") >> v.price;
    CborDecodeStream::named(m, "VerifiedPrice") >> v.verified_price;
    CborDecodeStream::named(m, "MinPieceSize") >> v.min_piece_size;
    CborDecodeStream::named(m, "MaxPieceSize") >> v.max_piece_size;
    CborDecodeStream::named(m, "Miner") >> v.miner;
    CborDecodeStream::named(m, "Timestamp") >> v.timestamp;
    CborDecodeStream::named(m, "Expiry") >> v.expiry;
    CborDecodeStream::named(m, "SeqNo") >> v.seq_no;
    return s;
  }

  struct SignedStorageAsk {
    StorageAsk ask;
    Signature signature;

    /** Bytes signed by miner worker key, CBOR of ask */
    outcome::result<Bytes> getDigest() const;
  };

  inline CBOR2_ENCODE(SignedStorageAsk) {
    auto m{CborEncodeStream::map()};
    m["Ask"] << v.ask;
    m["Signature"] << v.signature;
    return s << m;
  }

  inline CBOR2_DECODE(SignedStorageAsk) {
    auto m{s.map()};
    CborDecodeStream::named(m, "Ask") >> v.ask;
    CborDecodeStream::named(m, "Signature") >> v.signature;
    return s;
  }

  /**
   * Minimal storage price per epoch the ask allows for the proposal piece
   */
  TokenAmount minPricePerEpoch(const StorageAsk &ask,
                               const DealProposal &proposal);

  /**
   * Checks proposal price and piece size against ask
   */
  outcome::result<void> checkAskCompatible(const StorageAsk &ask,
                                           const DealProposal &proposal);
}  // namespace mk::markets::storage

OUTCOME_HPP_DECLARE_ERROR(mk::markets::storage, AskError);
