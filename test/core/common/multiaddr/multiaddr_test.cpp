/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/multiaddr/multiaddr.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"

using mk::common::dialTarget;
using mk::common::Multiaddr;
using mk::common::MultiaddrComponent;
using mk::common::MultiaddrError;
using mk::common::ProtocolCode;

/**
 * @given textual address stack
 * @when create
 * @then components keep order and string form is restored
 */
TEST(MultiaddrTest, Parse) {
  const std::string str{"/dns/example.com/tcp/443/tls/http"};
  EXPECT_OUTCOME_TRUE(address, Multiaddr::create(str));
  const auto &components{address.components()};
  ASSERT_EQ(components.size(), 4);
  EXPECT_EQ(components[0].code, ProtocolCode::kDns);
  EXPECT_EQ(components[0].value, "example.com");
  EXPECT_EQ(components[1].code, ProtocolCode::kTcp);
  EXPECT_EQ(components[1].value, "443");
  EXPECT_EQ(components[2].code, ProtocolCode::kTls);
  EXPECT_EQ(components[2].value, "");
  EXPECT_EQ(components[3].code, ProtocolCode::kHttp);
  EXPECT_EQ(address.getStringAddress(), str);
  EXPECT_TRUE(address.hasProtocol(ProtocolCode::kTls));
  EXPECT_FALSE(address.hasProtocol(ProtocolCode::kWs));
}

/**
 * @given address with repeated protocol
 * @when get value of protocol
 * @then first value returned, duplicates kept
 */
TEST(MultiaddrTest, Duplicates) {
  EXPECT_OUTCOME_TRUE(address, Multiaddr::create("/ip4/1.1.1.1/tcp/1/tcp/2/"));
  EXPECT_EQ(address.components().size(), 3);
  EXPECT_EQ(address.getFirstValueForProtocol(ProtocolCode::kTcp).value_or(""),
            "1");
  EXPECT_FALSE(address.getFirstValueForProtocol(ProtocolCode::kUdp));
}

/**
 * @given values in non-canonical form and legacy ipfs name
 * @when create
 * @then values and names are canonical
 */
TEST(MultiaddrTest, Canonical) {
  const auto peer{generatePeerId(1).toBase58()};
  EXPECT_OUTCOME_TRUE(
      address,
      Multiaddr::create("/ip6/2001:0db8:0:0:0:0:0:1/tcp/0080/ipfs/" + peer));
  EXPECT_EQ(address.getStringAddress(), "/ip6/2001:db8::1/tcp/80/p2p/" + peer);
}

/**
 * @given components list
 * @when create
 * @then values are validated
 */
TEST(MultiaddrTest, FromComponents) {
  EXPECT_OUTCOME_TRUE(
      address,
      Multiaddr::create(std::vector<MultiaddrComponent>{
          {ProtocolCode::kIp4, "10.0.0.1"}, {ProtocolCode::kUdp, "9"}}));
  EXPECT_EQ(address.getStringAddress(), "/ip4/10.0.0.1/udp/9");
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidValue,
                       Multiaddr::create(std::vector<MultiaddrComponent>{
                           {ProtocolCode::kHttp, "value"}}));
  EXPECT_OUTCOME_ERROR(
      MultiaddrError::kInvalidAddress,
      Multiaddr::create(std::vector<MultiaddrComponent>{}));
}

/**
 * @given libp2p address
 * @when create
 * @then same stack
 */
TEST(MultiaddrTest, FromLibp2p) {
  auto libp2p_address{
      libp2p::multi::Multiaddress::create("/ip4/127.0.0.1/tcp/40000").value()};
  EXPECT_OUTCOME_TRUE(address, Multiaddr::create(libp2p_address));
  EXPECT_EQ(address.getStringAddress(), "/ip4/127.0.0.1/tcp/40000");
}

/**
 * @given malformed addresses
 * @when create
 * @then errors
 */
TEST(MultiaddrTest, Invalid) {
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidAddress, Multiaddr::create(""));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidAddress,
                       Multiaddr::create("ip4/1.2.3.4"));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kUnknownProtocol,
                       Multiaddr::create("/foo/1"));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kMissingValue,
                       Multiaddr::create("/ip4"));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidValue,
                       Multiaddr::create("/ip4/999.1.1.1"));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidValue,
                       Multiaddr::create("/ip6/1.2.3.4"));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidValue,
                       Multiaddr::create("/ip4/1.2.3.4/tcp/65536"));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidValue,
                       Multiaddr::create("/ip4/1.2.3.4/tcp/-1"));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kInvalidValue,
                       Multiaddr::create("/p2p/invalid0"));
}

/**
 * @given thin waist addresses
 * @when extract dial target
 * @then host and optional port
 */
TEST(MultiaddrTest, DialTarget) {
  EXPECT_OUTCOME_TRUE(ip6, Multiaddr::create("/ip6zone/eth0/ip6/fe80::1/tcp/80/ws"));
  EXPECT_OUTCOME_TRUE(ip6_target, dialTarget(ip6));
  EXPECT_EQ(ip6_target.host, "fe80::1%eth0");
  EXPECT_EQ(ip6_target.port.value_or(0), 80);
  EXPECT_TRUE(ip6_target.is_ip6);

  EXPECT_OUTCOME_TRUE(dns, Multiaddr::create("/dns4/a.b/http"));
  EXPECT_OUTCOME_TRUE(dns_target, dialTarget(dns));
  EXPECT_EQ(dns_target.host, "a.b");
  EXPECT_FALSE(dns_target.port);
  EXPECT_FALSE(dns_target.is_ip6);
}

/**
 * @given addresses not starting with ip or dns
 * @when extract dial target
 * @then kNotThinWaist
 */
TEST(MultiaddrTest, NotThinWaist) {
  for (const auto &str : {"/tcp/80",
                          "/dnsaddr/bootstrap.io",
                          "/ip6zone/eth0/tcp/80",
                          "/ip6zone/eth0"}) {
    EXPECT_OUTCOME_TRUE(address, Multiaddr::create(str));
    EXPECT_OUTCOME_ERROR(MultiaddrError::kNotThinWaist, dialTarget(address));
  }
}
