/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/multiaddr/multiaddr.hpp"
#include "common/uri_parser/uri_parser.hpp"

namespace mk::common {
  /**
   * Converts address stack to URL, e.g.
   * /dns/thing.com/tcp/443/tls/http/urlescape/%2Fpath -> https://thing.com/path
   * Scheme precedence: https, http+tls, http, wss, ws+tls, ws, default http.
   * Port is omitted when it is default for the scheme.
   * Undecodable urlescape value yields empty path.
   * @return MultiaddrError::kNotThinWaist if host can't be extracted
   */
  outcome::result<Uri> toUrl(const Multiaddr &address);

  /** Default port of http and websocket schemes */
  boost::optional<uint16_t> defaultPort(std::string_view scheme);
}  // namespace mk::common
