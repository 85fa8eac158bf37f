/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address_codec.hpp"

#include <gtest/gtest.h>

#include "codec/cbor/cbor.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using mk::Bytes;
using mk::primitives::address::ActorExecHash;
using mk::primitives::address::Address;
using mk::primitives::address::AddressError;
using mk::primitives::address::BLSPublicKeyHash;
using mk::primitives::address::decode;
using mk::primitives::address::encode;
using mk::primitives::address::Protocol;
using mk::primitives::address::Secp256k1PublicKeyHash;

/**
 * @given id addresses
 * @when encode
 * @then protocol byte and varint payload
 */
TEST(AddressCodecTest, IdAddress) {
  EXPECT_EQ(encode(Address{0}), (Bytes{0x00, 0x00}));
  EXPECT_EQ(encode(Address{1024}), (Bytes{0x00, 0x80, 0x08}));
  EXPECT_EQ(encode(Address{32104785}), (Bytes{0x00, 0xd1, 0xc2, 0xa7, 0x0f}));
  EXPECT_OUTCOME_TRUE(address, decode(Bytes{0x00, 0xd1, 0xc2, 0xa7, 0x0f}));
  EXPECT_TRUE(address.isId());
  EXPECT_EQ(address.getId(), 32104785);
}

/**
 * @given key and actor addresses
 * @when encode and decode
 * @then protocol is kept
 */
TEST(AddressCodecTest, HashAddress) {
  Secp256k1PublicKeyHash secp{};
  secp.fill(1);
  ActorExecHash actor{};
  actor.fill(2);
  BLSPublicKeyHash bls{};
  bls.fill(3);
  for (const auto &address : {Address{secp}, Address{actor}, Address{bls}}) {
    const auto bytes{encode(address)};
    EXPECT_EQ(bytes[0], address.getProtocol());
    EXPECT_OUTCOME_EQ(decode(bytes), address);
  }
  EXPECT_TRUE(Address{secp}.isKeyType());
  EXPECT_TRUE(Address{bls}.isKeyType());
  EXPECT_FALSE(Address{actor}.isKeyType());
  EXPECT_EQ(Address{bls}.getProtocol(), Protocol::BLS);
}

/**
 * @given malformed bytes
 * @when decode
 * @then errors
 */
TEST(AddressCodecTest, Invalid) {
  EXPECT_OUTCOME_ERROR(AddressError::kInvalidPayload, decode(Bytes{}));
  EXPECT_OUTCOME_ERROR(AddressError::kUnknownProtocol, decode(Bytes{0x04, 0x01}));
  // 47 bytes of bls hash
  Bytes bls(48, 1);
  bls[0] = Protocol::BLS;
  EXPECT_OUTCOME_ERROR(AddressError::kInvalidPayload, decode(bls));
  // trailing byte after varint
  EXPECT_OUTCOME_ERROR(AddressError::kInvalidPayload,
                       decode(Bytes{0x00, 0x01, 0x01}));
}

/**
 * @given addresses
 * @then ordered by protocol then payload
 */
TEST(AddressCodecTest, Order) {
  Secp256k1PublicKeyHash secp{};
  EXPECT_LT(Address{5}, Address{secp});
  EXPECT_LT(Address{5}, Address{6});
  EXPECT_NE(Address{5}, Address{6});
}

/**
 * @given id address
 * @when encode and decode cbor
 * @then byte string of address bytes
 */
TEST(AddressCodecTest, Cbor) {
  EXPECT_OUTCOME_EQ(mk::codec::cbor::encode(Address{1000}), "4300E807"_unhex);
  EXPECT_OUTCOME_EQ(mk::codec::cbor::decode<Address>("4300E807"_unhex),
                    Address{1000});
  EXPECT_OUTCOME_ERROR(AddressError::kUnknownProtocol,
                       mk::codec::cbor::decode<Address>("420401"_unhex));
}
