/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/deal_proposal.hpp"
#include "primitives/piece/piece_data.hpp"

namespace mk::markets::storage::provider {
  using primitives::SectorNumber;
  using primitives::piece::PieceData;
  using primitives::piece::UnpaddedPieceSize;

  /**
   * Adds deal pieces to sectors
   */
  class PieceAdder {
   public:
    virtual ~PieceAdder() = default;

    /**
     * @return sector the piece was added to and padded piece size
     */
    virtual outcome::result<std::pair<SectorNumber, PaddedPieceSize>> addPiece(
        UnpaddedPieceSize size,
        PieceData piece_data,
        const PieceDealInfo &deal) = 0;
  };
}  // namespace mk::markets::storage::provider
