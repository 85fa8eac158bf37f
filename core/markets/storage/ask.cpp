/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/ask.hpp"

namespace mk::markets::storage {
  outcome::result<void> StorageAsk::validate() const {
    if (price < 0 || verified_price < 0) {
      return AskError::kNegativePrice;
    }
    if (!min_piece_size.validate() || !max_piece_size.validate()) {
      return AskError::kInvalidPieceSize;
    }
    if (min_piece_size > max_piece_size) {
      return AskError::kMinPieceSizeAboveMax;
    }
    return outcome::success();
  }

  outcome::result<Bytes> SignedStorageAsk::getDigest() const {
    return codec::cbor::encode(ask);
  }

  TokenAmount minPricePerEpoch(const StorageAsk &ask,
                               const DealProposal &proposal) {
    const auto &price{proposal.verified ? ask.verified_price : ask.price};
    return price * static_cast<uint64_t>(proposal.piece_size)
           / primitives::kGiB;
  }

  outcome::result<void> checkAskCompatible(const StorageAsk &ask,
                                           const DealProposal &proposal) {
    if (proposal.storage_price_per_epoch < minPricePerEpoch(ask, proposal)) {
      return AskError::kPriceBelowAsk;
    }
    if (proposal.piece_size < ask.min_piece_size) {
      return AskError::kPieceSizeBelowMin;
    }
    if (proposal.piece_size > ask.max_piece_size) {
      return AskError::kPieceSizeAboveMax;
    }
    return outcome::success();
  }
}  // namespace mk::markets::storage

OUTCOME_CPP_DEFINE_CATEGORY(mk::markets::storage, AskError, e) {
  using E = mk::markets::storage::AskError;
  switch (e) {
    case E::kNegativePrice:
      return "AskError: price must be non-negative";
    case E::kMinPieceSizeAboveMax:
      return "AskError: min piece size is above max piece size";
    case E::kInvalidPieceSize:
      return "AskError: piece size must be a power of 2 and at least 128";
    case E::kPriceBelowAsk:
      return "AskError: storage price per epoch is less than asking price";
    case E::kPieceSizeBelowMin:
      return "AskError: piece size is less than min piece size";
    case E::kPieceSizeAboveMax:
      return "AskError: piece size is more than max piece size";
  }
  return "AskError: unknown error";
}
