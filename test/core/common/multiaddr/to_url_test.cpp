/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/multiaddr/to_url.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/peer_id.hpp"

using mk::common::defaultPort;
using mk::common::Multiaddr;
using mk::common::MultiaddrError;
using mk::common::toUrl;

struct ToUrlCase {
  std::string address;
  std::string url;
};

class ToUrlTest : public testing::TestWithParam<ToUrlCase> {};

/**
 * @given address stack
 * @when convert to url
 * @then scheme follows precedence, default port omitted, ip6 bracketed
 */
TEST_P(ToUrlTest, Convert) {
  const auto &[str, expected] = GetParam();
  EXPECT_OUTCOME_TRUE(address, Multiaddr::create(str));
  EXPECT_OUTCOME_TRUE(url, toUrl(address));
  EXPECT_EQ(url.str(), expected);
}

INSTANTIATE_TEST_CASE_P(
    ToUrlTestCases,
    ToUrlTest,
    ::testing::ValuesIn(std::vector<ToUrlCase>{
        {"/dns/example.com/tcp/443/https", "https://example.com"},
        {"/dns/example.com/tcp/443/tls/http", "https://example.com"},
        {"/dns/example.com/tcp/8080/http", "http://example.com:8080"},
        {"/dns/example.com/tcp/443/wss", "wss://example.com"},
        {"/dns/example.com/tcp/443/tls/ws", "wss://example.com"},
        {"/dns6/example.com/tcp/80/ws", "ws://example.com"},
        {"/ip6/2001:db8::1/tcp/8080/ws", "ws://[2001:db8::1]:8080"},
        {"/ip6/::1/tcp/443/https", "https://[::1]"},
        {"/ip4/1.2.3.4/tcp/443/http", "http://1.2.3.4:443"},
        {"/ip4/1.2.3.4/tcp/80/tls/http", "https://1.2.3.4:80"},
        {"/ip4/1.2.3.4/tcp/80", "http://1.2.3.4"},
        {"/ip4/1.2.3.4/tcp/1234", "http://1.2.3.4:1234"},
        {"/ip4/1.2.3.4", "http://1.2.3.4"},
        {"/dns/thing.com/tcp/443/tls/http/urlescape/%2Fpath%2Fto%20file",
         "https://thing.com/path/to%20file"},
    }));

/**
 * @given https and tls+http stacks, wss and tls+ws stacks
 * @when convert to url
 * @then same urls
 */
TEST(ToUrlEquivalenceTest, TlsMarker) {
  auto convert{[](const std::string &str) {
    return toUrl(Multiaddr::create(str).value()).value().str();
  }};
  EXPECT_EQ(convert("/dns4/h.io/tcp/9000/tls/http"),
            convert("/dns4/h.io/tcp/9000/https"));
  EXPECT_EQ(convert("/dns4/h.io/tcp/9000/tls/ws"),
            convert("/dns4/h.io/tcp/9000/wss"));
}

/**
 * @given dns name and ip4 host
 * @when convert to url
 * @then host is not bracketed
 */
TEST(ToUrlEquivalenceTest, NoBrackets) {
  EXPECT_OUTCOME_TRUE(dns, Multiaddr::create("/dns/example.com/tcp/81/http"));
  EXPECT_OUTCOME_TRUE(dns_url, toUrl(dns));
  EXPECT_EQ(dns_url.host(), "example.com:81");
  EXPECT_OUTCOME_TRUE(ip4, Multiaddr::create("/ip4/10.1.1.1/tcp/81/http"));
  EXPECT_OUTCOME_TRUE(ip4_url, toUrl(ip4));
  EXPECT_EQ(ip4_url.host(), "10.1.1.1:81");
}

/**
 * @given urlescape value with invalid escape
 * @when convert to url
 * @then path is empty
 */
TEST(ToUrlEquivalenceTest, InvalidEscapedPath) {
  EXPECT_OUTCOME_TRUE(address,
                      Multiaddr::create("/ip4/1.2.3.4/tcp/80/http/urlescape/%zz"));
  EXPECT_OUTCOME_TRUE(url, toUrl(address));
  EXPECT_EQ(url.path(), "");
  EXPECT_EQ(url.str(), "http://1.2.3.4");
}

/**
 * @given address without dialable host
 * @when convert to url
 * @then kNotThinWaist
 */
TEST(ToUrlEquivalenceTest, NoHost) {
  EXPECT_OUTCOME_TRUE(
      address, Multiaddr::create("/p2p/" + generatePeerId(3).toBase58()));
  EXPECT_OUTCOME_ERROR(MultiaddrError::kNotThinWaist, toUrl(address));
}

/**
 * @given schemes
 * @when get default port
 * @then 80 for plain, 443 for secure, none for other
 */
TEST(ToUrlEquivalenceTest, DefaultPort) {
  EXPECT_EQ(defaultPort("http").value_or(0), 80);
  EXPECT_EQ(defaultPort("ws").value_or(0), 80);
  EXPECT_EQ(defaultPort("https").value_or(0), 443);
  EXPECT_EQ(defaultPort("wss").value_or(0), 443);
  EXPECT_FALSE(defaultPort("libp2p"));
}
