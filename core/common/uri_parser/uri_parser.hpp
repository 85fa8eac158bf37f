/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <string>
#include <string_view>

#include "common/outcome.hpp"

namespace mk::common {
  enum class UriError {
    kInvalidCharacter = 1,
    kInvalidHost,
    kInvalidPort,
    kMissingBracket,
  };

  /**
   * Generic URI: scheme://[userinfo@]host[:port][/path][?query][#fragment]
   * Scheme is optional on parse, host keeps its case.
   * Parsed host and path are kept as written for host() and str().
   */
  class Uri final {
   public:
    Uri() = default;

    static outcome::result<Uri> parse(std::string_view string);

    std::string str() const;

    const std::string &scheme() const {
      return scheme_;
    }

    void setScheme(std::string scheme) {
      scheme_ = std::move(scheme);
    }

    const std::string &userinfo() const {
      return userinfo_;
    }

    /** Host without brackets and port */
    const std::string &hostname() const {
      return host_;
    }

    void setHostname(std::string host) {
      host_ = std::move(host);
      raw_host_.clear();
    }

    /**
     * Host as it appears in authority, "host", "host:port", "[v6]:port".
     * Parsed port is not normalized, e.g. "h:0080" and "h:" stay as is.
     */
    std::string host() const;

    const boost::optional<uint16_t> &port() const {
      return port_;
    }

    void setPort(boost::optional<uint16_t> port) {
      port_ = port;
      raw_host_.clear();
    }

    /** Unescaped path */
    const std::string &path() const {
      return path_;
    }

    void setPath(std::string path) {
      path_ = std::move(path);
      raw_path_.clear();
    }

    /** Path as written if parsed, otherwise percent-encoded path */
    std::string escapedPath() const;

    bool hasQuery() const {
      return has_query_;
    }

    const std::string &query() const {
      return query_;
    }

    bool hasFragment() const {
      return has_fragment_;
    }

    const std::string &fragment() const {
      return fragment_;
    }

   private:
    outcome::result<void> parseAuthority(std::string_view authority);
    outcome::result<void> parseHostPort(std::string_view host_port);

    std::string scheme_;
    std::string userinfo_;
    std::string host_;
    std::string raw_host_;
    boost::optional<uint16_t> port_;
    std::string path_;
    std::string raw_path_;
    bool has_query_ = false;
    std::string query_;
    bool has_fragment_ = false;
    std::string fragment_;
  };
}  // namespace mk::common

OUTCOME_HPP_DECLARE_ERROR(mk::common, UriError);
