/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/cbor/streams_annotation.hpp"
#include "primitives/cid/cid.hpp"

namespace mk::primitives::piece {

  class PaddedPieceSize;

  class UnpaddedPieceSize {
   public:
    UnpaddedPieceSize() = default;

    explicit UnpaddedPieceSize(uint64_t size);

    operator uint64_t() const;  // NOLINT

    UnpaddedPieceSize &operator=(uint64_t rhs);

    PaddedPieceSize padded() const;

    outcome::result<void> validate() const;

   private:
    uint64_t size_{};
  };
  CBOR_ENCODE(UnpaddedPieceSize, v) {
    return s << static_cast<uint64_t>(v);
  }
  CBOR_DECODE(UnpaddedPieceSize, v) {
    uint64_t num{};
    s >> num;
    v = num;
    return s;
  }

  class PaddedPieceSize {
   public:
    PaddedPieceSize() = default;

    explicit PaddedPieceSize(uint64_t size);

    operator uint64_t() const;  // NOLINT

    PaddedPieceSize &operator=(uint64_t rhs);

    UnpaddedPieceSize unpadded() const;

    outcome::result<void> validate() const;

   private:
    uint64_t size_{};
  };
  CBOR_ENCODE(PaddedPieceSize, v) {
    return s << static_cast<uint64_t>(v);
  }
  CBOR_DECODE(PaddedPieceSize, v) {
    uint64_t num{};
    s >> num;
    v = num;
    return s;
  }

  struct PieceInfo {
    PaddedPieceSize size;
    CID cid;
  };

  inline bool operator==(const PieceInfo &lhs, const PieceInfo &rhs) {
    return lhs.size == rhs.size && lhs.cid == rhs.cid;
  }

}  // namespace mk::primitives::piece
