/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/multi/multihash.hpp>
#include <libp2p/peer/peer_id.hpp>

#include "common/bytes.hpp"

using libp2p::multi::Multihash;
using libp2p::peer::PeerId;

/**
 * Creates dummy PeerId
 */
inline PeerId generatePeerId(uint8_t value) {
  mk::Bytes buffer(32, value);
  auto hash = Multihash::create(libp2p::multi::sha256, buffer).value();
  return PeerId::fromHash(hash).value();
}
