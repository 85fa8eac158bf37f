/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/piece/piece.hpp"
#include "primitives/piece/piece_data.hpp"

namespace mk::markets::storage::provider {
  using primitives::piece::PieceData;
  using primitives::piece::PieceInfo;
  using primitives::piece::UnpaddedPieceSize;

  class CommpCalculator {
   public:
    virtual ~CommpCalculator() = default;

    /** Computes piece commitment of data */
    virtual outcome::result<PieceInfo> computeDataCid(
        UnpaddedPieceSize piece_size, PieceData piece_data) = 0;
  };
}  // namespace mk::markets::storage::provider
