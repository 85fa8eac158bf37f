/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/piece/piece.hpp"

#include "primitives/piece/piece_error.hpp"

namespace mk::primitives::piece {

  UnpaddedPieceSize::UnpaddedPieceSize(uint64_t size) : size_(size) {}

  UnpaddedPieceSize::operator uint64_t() const {
    return size_;
  }

  UnpaddedPieceSize &UnpaddedPieceSize::operator=(uint64_t rhs) {
    size_ = rhs;
    return *this;
  }

  PaddedPieceSize UnpaddedPieceSize::padded() const {
    return PaddedPieceSize(size_ + (size_ / 127));
  }

  outcome::result<void> UnpaddedPieceSize::validate() const {
    if (size_ < 127) {
      return PieceError::kLessThatMinimumSize;
    }

    // must be 127 * 2^n
    const auto power{size_ / 127};
    if ((size_ % 127) != 0 || (power & (power - 1)) != 0) {
      return PieceError::kInvalidUnpaddedSize;
    }

    return outcome::success();
  }

  PaddedPieceSize::PaddedPieceSize(uint64_t size) : size_(size) {}

  PaddedPieceSize::operator uint64_t() const {
    return size_;
  }

  PaddedPieceSize &PaddedPieceSize::operator=(uint64_t rhs) {
    size_ = rhs;
    return *this;
  }

  UnpaddedPieceSize PaddedPieceSize::unpadded() const {
    return UnpaddedPieceSize(size_ - (size_ / 128));
  }

  outcome::result<void> PaddedPieceSize::validate() const {
    if (size_ < 128) {
      return PieceError::kLessThatMinimumPaddedSize;
    }

    if ((size_ & (size_ - 1)) != 0) {
      return PieceError::kInvalidPaddedSize;
    }

    return outcome::success();
  }

}  // namespace mk::primitives::piece
