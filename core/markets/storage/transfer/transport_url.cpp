/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/transfer/transport_url.hpp"

#include "common/logger.hpp"
#include "common/uri_parser/uri_parser.hpp"
#include "markets/storage/transfer/transfer_error.hpp"

namespace mk::markets::storage {
  using common::Multiaddr;
  using common::MultiaddrComponent;
  using common::ProtocolCode;
  using libp2p::peer::PeerId;

  namespace {
    common::Logger log() {
      static common::Logger logger{common::createLogger("transport_url")};
      return logger;
    }

    outcome::result<TransportUrl> parseLibp2pUrl(std::string_view url) {
      const auto prefix{std::string{kLibp2pScheme} + "://"};
      if (url.substr(0, prefix.size()) != prefix) {
        log()->debug("libp2p url '{}' must start with prefix '{}'", url, prefix);
        return TransferError::kTransferUrlInvalid;
      }

      auto address{Multiaddr::create(url.substr(prefix.size()))};
      if (!address) {
        log()->debug("cannot parse multiaddr of url '{}': {}",
                     url,
                     address.error().message());
        return TransferError::kTransferUrlInvalid;
      }
      auto components{address.value().components()};
      if (components.back().code != ProtocolCode::kP2p) {
        log()->debug("url '{}' doesn't end with peer id", url);
        return TransferError::kTransferUrlInvalid;
      }
      auto peer_id{PeerId::fromBase58(components.back().value)};
      if (!peer_id) {
        log()->debug("invalid peer id in url '{}'", url);
        return TransferError::kTransferUrlInvalid;
      }
      components.pop_back();
      if (components.empty()) {
        log()->debug("expected only one address in url '{}'", url);
        return TransferError::kTransferUrlInvalid;
      }

      TransportUrl result;
      result.scheme = std::string{kLibp2pScheme};
      result.url = prefix + peer_id.value().toBase58();
      OUTCOME_TRY(dial_address, Multiaddr::create(std::move(components)));
      result.multiaddr = std::move(dial_address);
      result.peer_id = std::move(peer_id.value());
      return result;
    }
  }  // namespace

  outcome::result<TransportUrl> parseTransportUrl(std::string_view url) {
    auto uri{common::Uri::parse(url)};
    if (!uri) {
      log()->debug("parsing url '{}': {}", url, uri.error().message());
      return TransferError::kTransferUrlInvalid;
    }
    if (uri.value().scheme().empty()) {
      log()->debug("parsing url '{}': could not parse scheme", url);
      return TransferError::kTransferUrlInvalid;
    }
    if (uri.value().scheme() == kLibp2pScheme) {
      return parseLibp2pUrl(url);
    }
    TransportUrl result;
    result.scheme = uri.value().scheme();
    result.url = std::string{url};
    return result;
  }
}  // namespace mk::markets::storage
