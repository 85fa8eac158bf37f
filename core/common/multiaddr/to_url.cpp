/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/multiaddr/to_url.hpp"

#include <map>

#include "common/logger.hpp"
#include "common/uri_parser/percent_encoding.hpp"

namespace mk::common {
  namespace {
    Logger log() {
      static Logger logger{createLogger("to_url")};
      return logger;
    }

    std::string_view selectScheme(
        const std::map<ProtocolCode, std::string> &protocols) {
      auto has{[&](ProtocolCode code) { return protocols.count(code) != 0; }};
      if (has(ProtocolCode::kHttps)) {
        return "https";
      }
      if (has(ProtocolCode::kHttp)) {
        return has(ProtocolCode::kTls) ? "https" : "http";
      }
      if (has(ProtocolCode::kWss)) {
        return "wss";
      }
      if (has(ProtocolCode::kWs)) {
        return has(ProtocolCode::kTls) ? "wss" : "ws";
      }
      return "http";
    }
  }  // namespace

  boost::optional<uint16_t> defaultPort(std::string_view scheme) {
    if (scheme == "http" || scheme == "ws") {
      return 80;
    }
    if (scheme == "https" || scheme == "wss") {
      return 443;
    }
    return boost::none;
  }

  outcome::result<Uri> toUrl(const Multiaddr &address) {
    OUTCOME_TRY(target, dialTarget(address));

    std::map<ProtocolCode, std::string> protocols;
    for (const auto &component : address.components()) {
      protocols.emplace(component.code, component.value);
    }

    Uri url;
    url.setScheme(std::string{selectScheme(protocols)});
    url.setHostname(std::move(target.host));
    if (target.port != defaultPort(url.scheme())) {
      url.setPort(target.port);
    }

    auto escaped{protocols.find(ProtocolCode::kUrlEscape)};
    if (escaped != protocols.end()) {
      auto path{PercentEncoding::decode(escaped->second)};
      if (path) {
        url.setPath(std::move(path.value()));
      } else {
        log()->debug("ignoring path {} of {}: {}",
                     escaped->second,
                     address.getStringAddress(),
                     path.error().message());
      }
    }
    return url;
  }
}  // namespace mk::common
