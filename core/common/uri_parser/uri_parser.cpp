/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/uri_parser/uri_parser.hpp"

#include "common/uri_parser/percent_encoding.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <cctype>
#include <sstream>

namespace mk::common {
  namespace {
    constexpr std::string_view kHostSymbols{"-._~!$&'()*+,;=%"};

    bool isControl(char c) {
      const auto u = static_cast<unsigned char>(c);
      return u < 0x20 || u == 0x7f;
    }

    bool isSchemeSymbol(char c, bool first) {
      if (std::isalpha(static_cast<unsigned char>(c)) != 0) {
        return true;
      }
      return !first
             && (std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '+'
                 || c == '-' || c == '.');
    }

    /**
     * Splits "scheme:rest", scheme is empty if there is none
     */
    std::pair<std::string_view, std::string_view> splitScheme(
        std::string_view s) {
      for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == ':') {
          if (i == 0) {
            break;
          }
          return {s.substr(0, i), s.substr(i + 1)};
        }
        if (!isSchemeSymbol(s[i], i == 0)) {
          break;
        }
      }
      return {{}, s};
    }
  }  // namespace

  outcome::result<Uri> Uri::parse(std::string_view string) {
    for (const auto c : string) {
      if (isControl(c)) {
        return UriError::kInvalidCharacter;
      }
    }

    Uri uri;
    auto [scheme, rest] = splitScheme(string);
    uri.scheme_ = boost::algorithm::to_lower_copy(std::string{scheme});

    // fragment:
    if (auto pos = rest.find('#'); pos != std::string_view::npos) {
      uri.has_fragment_ = true;
      uri.fragment_ = std::string{rest.substr(pos + 1)};
      rest = rest.substr(0, pos);
    }

    // query:
    if (auto pos = rest.find('?'); pos != std::string_view::npos) {
      uri.has_query_ = true;
      uri.query_ = std::string{rest.substr(pos + 1)};
      rest = rest.substr(0, pos);
    }

    // authority:
    if (rest.substr(0, 2) == "//") {
      rest = rest.substr(2);
      const auto slash = rest.find('/');
      OUTCOME_TRY(uri.parseAuthority(rest.substr(0, slash)));
      rest = slash == std::string_view::npos ? std::string_view{}
                                             : rest.substr(slash);
    }

    // path:
    OUTCOME_TRYA(uri.path_, PercentEncoding::decode(rest));
    uri.raw_path_ = std::string{rest};
    return uri;
  }

  outcome::result<void> Uri::parseAuthority(std::string_view authority) {
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
      userinfo_ = std::string{authority.substr(0, at)};
      authority = authority.substr(at + 1);
    }
    return parseHostPort(authority);
  }

  outcome::result<void> Uri::parseHostPort(std::string_view host_port) {
    raw_host_ = std::string{host_port};
    std::string_view port;
    if (!host_port.empty() && host_port.front() == '[') {
      const auto close = host_port.find(']');
      if (close == std::string_view::npos) {
        return UriError::kMissingBracket;
      }
      host_ = std::string{host_port.substr(1, close - 1)};
      auto literal = host_;
      if (auto zone = literal.find('%'); zone != std::string::npos) {
        literal.resize(zone);
      }
      boost::system::error_code ec;
      boost::asio::ip::make_address_v6(literal, ec);
      if (ec) {
        return UriError::kInvalidHost;
      }
      const auto after = host_port.substr(close + 1);
      if (!after.empty()) {
        if (after.front() != ':') {
          return UriError::kInvalidHost;
        }
        port = after.substr(1);
      }
    } else {
      const auto colon = host_port.rfind(':');
      if (colon != std::string_view::npos) {
        port = host_port.substr(colon + 1);
        host_port = host_port.substr(0, colon);
      }
      for (const auto c : host_port) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0
            && kHostSymbols.find(c) == std::string_view::npos) {
          return UriError::kInvalidHost;
        }
      }
      host_ = std::string{host_port};
    }

    // port, empty after colon is allowed:
    if (!port.empty()) {
      uint64_t value = 0;
      for (const auto c : port) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
          return UriError::kInvalidPort;
        }
        value = value * 10 + (c - '0');
        if (value > 65535) {
          return UriError::kInvalidPort;
        }
      }
      port_ = static_cast<uint16_t>(value);
    }
    return outcome::success();
  }

  std::string Uri::host() const {
    if (!raw_host_.empty()) {
      return raw_host_;
    }
    std::string host;
    if (host_.find(':') != std::string::npos) {
      host = "[" + host_ + "]";
    } else {
      host = host_;
    }
    if (port_) {
      host += ":" + std::to_string(*port_);
    }
    return host;
  }

  std::string Uri::escapedPath() const {
    if (!raw_path_.empty()) {
      return raw_path_;
    }
    return PercentEncoding::encodePath(path_);
  }

  std::string Uri::str() const {
    std::stringstream ss;

    if (!scheme_.empty()) {
      ss << scheme_ << ':';
    }
    if (!host_.empty() || !userinfo_.empty() || port_) {
      ss << "//";
      if (!userinfo_.empty()) {
        ss << userinfo_ << '@';
      }
      ss << host();
      if (!path_.empty() && path_.front() != '/') {
        ss << '/';
      }
    }

    ss << escapedPath();

    if (has_query_) {
      ss << '?' << query_;
    }

    if (has_fragment_) {
      ss << '#' << fragment_;
    }

    return ss.str();
  }
}  // namespace mk::common

OUTCOME_CPP_DEFINE_CATEGORY(mk::common, UriError, e) {
  using E = mk::common::UriError;
  switch (e) {
    case E::kInvalidCharacter:
      return "Uri: invalid control character in URL";
    case E::kInvalidHost:
      return "Uri: wrong hostname";
    case E::kInvalidPort:
      return "Uri: wrong port";
    case E::kMissingBracket:
      return "Uri: missing ']' in host";
  }
  return "Uri: unknown error";
}
