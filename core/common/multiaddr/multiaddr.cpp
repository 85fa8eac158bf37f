/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/multiaddr/multiaddr.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/asio/ip/address.hpp>
#include <libp2p/peer/peer_id.hpp>

namespace mk::common {
  namespace {
    enum class ValueKind {
      kNone,
      kIp4,
      kIp6,
      kZone,
      kPort,
      kName,
      kPeerId,
      kEscapedPath,
    };

    struct ProtocolInfo {
      ProtocolCode code;
      std::string_view name;
      ValueKind kind;
    };

    constexpr ProtocolInfo kProtocols[]{
        {ProtocolCode::kIp4, "ip4", ValueKind::kIp4},
        {ProtocolCode::kTcp, "tcp", ValueKind::kPort},
        {ProtocolCode::kIp6, "ip6", ValueKind::kIp6},
        {ProtocolCode::kIp6Zone, "ip6zone", ValueKind::kZone},
        {ProtocolCode::kDns, "dns", ValueKind::kName},
        {ProtocolCode::kDns4, "dns4", ValueKind::kName},
        {ProtocolCode::kDns6, "dns6", ValueKind::kName},
        {ProtocolCode::kDnsAddr, "dnsaddr", ValueKind::kName},
        {ProtocolCode::kUdp, "udp", ValueKind::kPort},
        {ProtocolCode::kP2p, "p2p", ValueKind::kPeerId},
        {ProtocolCode::kHttps, "https", ValueKind::kNone},
        {ProtocolCode::kTls, "tls", ValueKind::kNone},
        {ProtocolCode::kWs, "ws", ValueKind::kNone},
        {ProtocolCode::kWss, "wss", ValueKind::kNone},
        {ProtocolCode::kHttp, "http", ValueKind::kNone},
        {ProtocolCode::kUrlEscape, "urlescape", ValueKind::kEscapedPath},
    };

    const ProtocolInfo *findProtocol(ProtocolCode code) {
      for (const auto &info : kProtocols) {
        if (info.code == code) {
          return &info;
        }
      }
      return nullptr;
    }

    const ProtocolInfo *findProtocol(std::string_view name) {
      // legacy name of p2p
      if (name == "ipfs") {
        return findProtocol(ProtocolCode::kP2p);
      }
      for (const auto &info : kProtocols) {
        if (info.name == name) {
          return &info;
        }
      }
      return nullptr;
    }

    /** Checks value, returns its canonical form */
    outcome::result<std::string> checkValue(ValueKind kind,
                                            const std::string &value) {
      boost::system::error_code ec;
      switch (kind) {
        case ValueKind::kNone:
          return value;
        case ValueKind::kIp4: {
          auto ip{boost::asio::ip::make_address_v4(value, ec)};
          if (ec) {
            return MultiaddrError::kInvalidValue;
          }
          return ip.to_string();
        }
        case ValueKind::kIp6: {
          auto ip{boost::asio::ip::make_address_v6(value, ec)};
          if (ec || ip.scope_id() != 0) {
            return MultiaddrError::kInvalidValue;
          }
          return ip.to_string();
        }
        case ValueKind::kPort: {
          if (value.empty() || value.size() > 5) {
            return MultiaddrError::kInvalidValue;
          }
          uint32_t port{0};
          for (auto c : value) {
            if (c < '0' || c > '9') {
              return MultiaddrError::kInvalidValue;
            }
            port = port * 10 + (c - '0');
          }
          if (port > 0xFFFF) {
            return MultiaddrError::kInvalidValue;
          }
          return std::to_string(port);
        }
        case ValueKind::kPeerId:
          if (!libp2p::peer::PeerId::fromBase58(value)) {
            return MultiaddrError::kInvalidValue;
          }
          return value;
        case ValueKind::kZone:
        case ValueKind::kName:
        case ValueKind::kEscapedPath:
          if (value.empty() || value.find('/') != std::string::npos) {
            return MultiaddrError::kInvalidValue;
          }
          return value;
      }
      return MultiaddrError::kInvalidValue;
    }
  }  // namespace

  std::string_view protocolName(ProtocolCode code) {
    if (auto info{findProtocol(code)}) {
      return info->name;
    }
    return "unknown";
  }

  outcome::result<Multiaddr> Multiaddr::create(std::string_view address) {
    if (address.empty() || address.front() != '/') {
      return MultiaddrError::kInvalidAddress;
    }
    while (address.size() > 1 && address.back() == '/') {
      address.remove_suffix(1);
    }
    std::vector<std::string> parts;
    boost::algorithm::split(parts,
                            address.substr(1),
                            [](char c) { return c == '/'; });
    std::vector<MultiaddrComponent> components;
    for (size_t i{0}; i < parts.size(); ++i) {
      auto info{findProtocol(parts[i])};
      if (!info) {
        return MultiaddrError::kUnknownProtocol;
      }
      MultiaddrComponent component{info->code, {}};
      if (info->kind != ValueKind::kNone) {
        if (++i == parts.size()) {
          return MultiaddrError::kMissingValue;
        }
        component.value = parts[i];
      }
      components.push_back(std::move(component));
    }
    return create(std::move(components));
  }

  outcome::result<Multiaddr> Multiaddr::create(
      const libp2p::multi::Multiaddress &address) {
    return create(std::string_view{address.getStringAddress()});
  }

  outcome::result<Multiaddr> Multiaddr::create(
      std::vector<MultiaddrComponent> components) {
    if (components.empty()) {
      return MultiaddrError::kInvalidAddress;
    }
    for (auto &component : components) {
      auto info{findProtocol(component.code)};
      if (!info) {
        return MultiaddrError::kUnknownProtocol;
      }
      if (info->kind == ValueKind::kNone) {
        if (!component.value.empty()) {
          return MultiaddrError::kInvalidValue;
        }
        continue;
      }
      OUTCOME_TRY(value, checkValue(info->kind, component.value));
      component.value = std::move(value);
    }
    return Multiaddr{std::move(components)};
  }

  bool Multiaddr::hasProtocol(ProtocolCode code) const {
    return getFirstValueForProtocol(code).has_value();
  }

  boost::optional<std::string> Multiaddr::getFirstValueForProtocol(
      ProtocolCode code) const {
    for (const auto &component : components_) {
      if (component.code == code) {
        return component.value;
      }
    }
    return boost::none;
  }

  std::string Multiaddr::getStringAddress() const {
    std::string result;
    for (const auto &component : components_) {
      result += '/';
      result += protocolName(component.code);
      if (!component.value.empty()) {
        result += '/';
        result += component.value;
      }
    }
    return result;
  }

  outcome::result<DialTarget> dialTarget(const Multiaddr &address) {
    const auto &components{address.components()};
    DialTarget target;
    size_t next{0};
    std::string zone;
    if (components[next].code == ProtocolCode::kIp6Zone) {
      zone = components[next].value;
      ++next;
      if (next == components.size()
          || components[next].code != ProtocolCode::kIp6) {
        return MultiaddrError::kNotThinWaist;
      }
    }
    if (next == components.size()) {
      return MultiaddrError::kNotThinWaist;
    }
    const auto &network{components[next]};
    switch (network.code) {
      case ProtocolCode::kIp6:
        target.is_ip6 = true;
        target.host = network.value;
        if (!zone.empty()) {
          target.host += '%';
          target.host += zone;
        }
        break;
      case ProtocolCode::kIp4:
      case ProtocolCode::kDns:
      case ProtocolCode::kDns4:
      case ProtocolCode::kDns6:
        target.host = network.value;
        break;
      default:
        return MultiaddrError::kNotThinWaist;
    }
    ++next;
    if (next < components.size()
        && (components[next].code == ProtocolCode::kTcp
            || components[next].code == ProtocolCode::kUdp)) {
      target.port = static_cast<uint16_t>(std::stoul(components[next].value));
    }
    return target;
  }
}  // namespace mk::common

OUTCOME_CPP_DEFINE_CATEGORY(mk::common, MultiaddrError, e) {
  using E = mk::common::MultiaddrError;
  switch (e) {
    case E::kInvalidAddress:
      return "MultiaddrError: address must be non-empty and start with '/'";
    case E::kUnknownProtocol:
      return "MultiaddrError: unknown protocol";
    case E::kMissingValue:
      return "MultiaddrError: protocol requires value";
    case E::kInvalidValue:
      return "MultiaddrError: invalid protocol value";
    case E::kNotThinWaist:
      return "MultiaddrError: address doesn't start with ip or dns component";
  }
  return "MultiaddrError: unknown error";
}
