/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <libp2p/multi/multiaddress.hpp>
#include <string>
#include <vector>

#include "common/cmp.hpp"
#include "common/outcome.hpp"

namespace mk::common {
  enum class MultiaddrError {
    kInvalidAddress = 1,
    kUnknownProtocol,
    kMissingValue,
    kInvalidValue,
    kNotThinWaist,
  };

  /**
   * Multicodec codes of protocols an address stack may carry
   */
  enum class ProtocolCode : uint64_t {
    kIp4 = 0x04,
    kTcp = 0x06,
    kIp6 = 0x29,
    kIp6Zone = 0x2a,
    kDns = 0x35,
    kDns4 = 0x36,
    kDns6 = 0x37,
    kDnsAddr = 0x38,
    kUdp = 0x0111,
    kP2p = 0x01a5,
    kHttps = 0x01bb,
    kTls = 0x01c0,
    kWs = 0x01dd,
    kWss = 0x01de,
    kHttp = 0x01e0,
    /** Application defined protocol, value is url-escaped http path */
    kUrlEscape = 0x300200,
  };

  /** Textual name of protocol, e.g. "ip4" */
  std::string_view protocolName(ProtocolCode code);

  struct MultiaddrComponent {
    ProtocolCode code{};
    /** Empty for protocols without value, e.g. "http" */
    std::string value;
  };
  inline bool operator==(const MultiaddrComponent &lhs,
                         const MultiaddrComponent &rhs) {
    return lhs.code == rhs.code && lhs.value == rhs.value;
  }

  /**
   * Ordered stack of protocol components, e.g. /dns/thing.com/tcp/443/tls/http
   * Keeps original order and repeated protocols.
   */
  class Multiaddr {
   public:
    /** Parses "/proto/value/proto/..." */
    static outcome::result<Multiaddr> create(std::string_view address);

    /** Converts libp2p address, all its protocols must be known here */
    static outcome::result<Multiaddr> create(
        const libp2p::multi::Multiaddress &address);

    /** Validates values of components */
    static outcome::result<Multiaddr> create(
        std::vector<MultiaddrComponent> components);

    const std::vector<MultiaddrComponent> &components() const {
      return components_;
    }

    bool hasProtocol(ProtocolCode code) const;

    /** Value of first component with the code */
    boost::optional<std::string> getFirstValueForProtocol(
        ProtocolCode code) const;

    std::string getStringAddress() const;

    bool operator==(const Multiaddr &other) const {
      return components_ == other.components_;
    }

   private:
    explicit Multiaddr(std::vector<MultiaddrComponent> components)
        : components_{std::move(components)} {}

    std::vector<MultiaddrComponent> components_;
  };
  MK_OPERATOR_NOT_EQUAL(Multiaddr)

  /**
   * Dial target of a thin waist address, network layer protocol optionally
   * followed by tcp or udp port
   */
  struct DialTarget {
    /** Name or literal ip, ip6 zone is joined with '%' */
    std::string host;
    boost::optional<uint16_t> port;
    bool is_ip6{false};
  };

  /**
   * Extracts dial target from leading components of address
   * @return kNotThinWaist if address doesn't start with ip4, ip6 or dns
   */
  outcome::result<DialTarget> dialTarget(const Multiaddr &address);
}  // namespace mk::common

OUTCOME_HPP_DECLARE_ERROR(mk::common, MultiaddrError);
