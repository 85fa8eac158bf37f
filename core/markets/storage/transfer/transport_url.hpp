/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/peer/peer_id.hpp>

#include "common/multiaddr/multiaddr.hpp"

namespace mk::markets::storage {
  constexpr std::string_view kLibp2pScheme{"libp2p"};

  /**
   * Url of transfer endpoint, either conventional url or
   * libp2p://<multiaddr>/p2p/<peer id>
   */
  struct TransportUrl {
    /** Lowercase scheme */
    std::string scheme;
    /** Source url, "libp2p://<peer id>" for libp2p url */
    std::string url;
    /** Set for libp2p url only */
    boost::optional<libp2p::peer::PeerId> peer_id;
    /** Set for libp2p url only, address without peer id */
    boost::optional<common::Multiaddr> multiaddr;

    bool isLibp2p() const {
      return scheme == kLibp2pScheme;
    }
  };

  /**
   * Parses transfer url, scheme is mandatory
   * @return TransferError::kTransferUrlInvalid on failure
   */
  outcome::result<TransportUrl> parseTransportUrl(std::string_view url);
}  // namespace mk::markets::storage
