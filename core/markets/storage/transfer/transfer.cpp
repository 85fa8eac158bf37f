/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/transfer/transfer.hpp"

#include "codec/json/json.hpp"
#include "common/logger.hpp"
#include "common/multiaddr/to_url.hpp"
#include "common/uri_parser/uri_parser.hpp"
#include "markets/storage/transfer/transfer_error.hpp"
#include "markets/storage/transfer/transport_url.hpp"

namespace mk::markets::storage {
  namespace {
    common::Logger log() {
      static common::Logger logger{common::createLogger("transfer")};
      return logger;
    }
  }  // namespace

  const std::string &transferTypeTag(TransferType type) {
    return type == TransferType::kLibp2p ? kTransferTypeLibp2p
                                         : kTransferTypeHttp;
  }

  boost::optional<TransferType> transferTypeFromTag(std::string_view tag) {
    if (tag == kTransferTypeHttp) {
      return TransferType::kHttp;
    }
    if (tag == kTransferTypeLibp2p) {
      return TransferType::kLibp2p;
    }
    return boost::none;
  }

  Transfer Transfer::make(TransferType type,
                          const HttpRequest &request,
                          uint64_t size,
                          std::string client_id) {
    Transfer transfer;
    transfer.type = transferTypeTag(type);
    transfer.client_id = std::move(client_id);
    transfer.params = codec::json::encodeBytes(request);
    transfer.size = size;
    return transfer;
  }

  bool Transfer::isZero() const {
    return type.empty() && client_id.empty() && params.empty() && size == 0;
  }

  outcome::result<TransferParams> Transfer::decodeParams() const {
    const auto transfer_type{transferTypeFromTag(type)};
    if (!transfer_type) {
      log()->debug("cannot parse params for unrecognized transfer type '{}'",
                   type);
      return TransferError::kUnsupportedTransferType;
    }
    auto request{codec::json::decodeBytes<HttpRequest>(params)};
    if (!request) {
      log()->debug("failed to de-serialize transport params bytes '{}': {}",
                   bytestr(params),
                   request.error().message());
      return TransferError::kTransferParamsInvalid;
    }
    return TransferParams{*transfer_type, std::move(request.value())};
  }

  outcome::result<std::string> Transfer::host() const {
    OUTCOME_TRY(decoded, decodeParams());
    const auto &url{decoded.request.url};
    OUTCOME_TRY(transport_url, parseTransportUrl(url));

    if (transport_url.isLibp2p()) {
      auto http_url{common::toUrl(*transport_url.multiaddr)};
      if (!http_url) {
        log()->debug("cannot get host of '{}': {}",
                     url,
                     http_url.error().message());
        return TransferError::kAddressResolution;
      }
      return http_url.value().host();
    }

    auto http_url{common::Uri::parse(transport_url.url)};
    if (!http_url) {
      log()->debug("cannot parse url '{}' from '{}': {}",
                   transport_url.url,
                   url,
                   http_url.error().message());
      return TransferError::kTransferUrlInvalid;
    }
    return http_url.value().host();
  }
}  // namespace mk::markets::storage
