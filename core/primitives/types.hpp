/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "primitives/big_int.hpp"

namespace mk::primitives {
  using ActorId = uint64_t;

  using TokenAmount = BigInt;

  using ChainEpoch = int64_t;

  using EpochDuration = int64_t;

  using SectorNumber = uint64_t;

  using DealId = uint64_t;

  /** Ask prices are per GiB of padded piece size */
  constexpr uint64_t kGiB{uint64_t{1} << 30};
}  // namespace mk::primitives
