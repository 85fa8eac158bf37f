/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor.hpp"
#include "primitives/big_int.hpp"

#include <gtest/gtest.h>
#include <boost/optional/optional_io.hpp>
#include "testutil/cid.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using mk::Bytes;
using mk::BytesN;
using mk::CID;
using mk::codec::cbor::CborDecodeError;
using mk::codec::cbor::CborDecodeStream;
using mk::codec::cbor::CborEncodeStream;
using mk::codec::cbor::decode;
using mk::codec::cbor::encode;

/**
 * @given Element or CBOR
 * @when encode decode
 * @then As expected
 */
TEST(Cbor, EncodeDecode) {
  EXPECT_OUTCOME_EQ(encode(1), "01"_unhex);
  EXPECT_OUTCOME_EQ(decode<int>("01"_unhex), 1);
  EXPECT_OUTCOME_EQ(decode<int>(encode(1).value()), 1);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kWrongType, decode<int>("80"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kInvalidCbor, decode<int>(Bytes{}));
}

/**
 * @given Integers and bool
 * @when Encode
 * @then Encoded as expected
 */
TEST(Cbor, Integral) {
  EXPECT_OUTCOME_EQ(encode(0ull), "00"_unhex);
  EXPECT_OUTCOME_EQ(encode(23), "17"_unhex);
  EXPECT_OUTCOME_EQ(encode(24), "1818"_unhex);
  EXPECT_OUTCOME_EQ(encode(-1), "20"_unhex);
  EXPECT_OUTCOME_EQ(encode(int64_t{-500}), "3901F3"_unhex);
  EXPECT_OUTCOME_EQ(encode(UINT64_MAX), "1BFFFFFFFFFFFFFFFF"_unhex);
  EXPECT_OUTCOME_EQ(encode(false), "F4"_unhex);
  EXPECT_OUTCOME_EQ(encode(true), "F5"_unhex);
  EXPECT_OUTCOME_EQ(decode<int64_t>("3901F3"_unhex), -500);
  EXPECT_OUTCOME_EQ(decode<bool>("F5"_unhex), true);
}

/**
 * @given Integers out of range of decoded type
 * @when Decode
 * @then kIntOverflow
 */
TEST(Cbor, IntOverflow) {
  EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                       decode<uint8_t>("190100"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                       decode<uint64_t>("20"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                       decode<int64_t>("1BFFFFFFFFFFFFFFFF"_unhex));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kIntOverflow,
                       decode<int8_t>("3880"_unhex));
}

/** String and bytes CBOR encoding and decoding */
TEST(Cbor, StringBytes) {
  EXPECT_OUTCOME_EQ(encode(std::string{"abc"}), "63616263"_unhex);
  EXPECT_OUTCOME_EQ(decode<std::string>("63616263"_unhex), "abc");
  EXPECT_OUTCOME_EQ(encode(Bytes{0xCA, 0xFE}), "42CAFE"_unhex);
  EXPECT_OUTCOME_EQ(decode<Bytes>("42CAFE"_unhex), (Bytes{0xCA, 0xFE}));
  EXPECT_OUTCOME_ERROR(CborDecodeError::kWrongType,
                       decode<std::string>("42CAFE"_unhex));
  // truncated string
  EXPECT_OUTCOME_ERROR(CborDecodeError::kInvalidCbor,
                       decode<std::string>("6361"_unhex));
}

/// Decode bytes of fixed size
TEST(Cbor, DecodeFixedBytes) {
  using Bytes3 = BytesN<3>;
  EXPECT_OUTCOME_ERROR(CborDecodeError::kWrongSize,
                       decode<Bytes3>("42CAFE"_unhex));
  EXPECT_OUTCOME_EQ(decode<Bytes3>("43CAFEDE"_unhex), (Bytes3{0xCA, 0xFE, 0xDE}));
}

/** BigInt CBOR encoding and decoding */
TEST(Cbor, BigInt) {
  using mk::primitives::BigInt;
  EXPECT_OUTCOME_EQ(encode(BigInt(0xCAFE)), "4300CAFE"_unhex);
  EXPECT_OUTCOME_EQ(decode<BigInt>("4300CAFE"_unhex), 0xCAFE);
  EXPECT_OUTCOME_EQ(encode(BigInt(-0xCAFE)), "4301CAFE"_unhex);
  EXPECT_OUTCOME_EQ(decode<BigInt>("4301CAFE"_unhex), -0xCAFE);
  EXPECT_OUTCOME_EQ(encode(BigInt(0)), "40"_unhex);
  EXPECT_OUTCOME_EQ(decode<BigInt>("40"_unhex), 0);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kInvalidCbor,
                       decode<BigInt>("4302CAFE"_unhex));
}

/** Null CBOR encoding and decoding */
TEST(Cbor, Null) {
  EXPECT_OUTCOME_EQ(encode(nullptr), "F6"_unhex);
  EXPECT_TRUE(CborDecodeStream("F6"_unhex).isNull());
  EXPECT_FALSE(CborDecodeStream("01"_unhex).isNull());
}

/** Optional CBOR encoding and decoding */
TEST(Cbor, Optional) {
  boost::optional<int> empty;
  EXPECT_OUTCOME_EQ(encode(empty), "F6"_unhex);
  EXPECT_OUTCOME_EQ(decode<boost::optional<int>>("F6"_unhex), empty);
  EXPECT_OUTCOME_EQ(encode(boost::make_optional(3)), "03"_unhex);
  EXPECT_OUTCOME_EQ(decode<boost::optional<int>>("03"_unhex), 3);
}

/// Vector CBOR encoding and decoding
TEST(Cbor, Vector) {
  std::vector<int> a{2, 5, 9};
  EXPECT_OUTCOME_EQ(encode(a), "83020509"_unhex);
  EXPECT_OUTCOME_EQ(decode<std::vector<int>>("83020509"_unhex), a);
  EXPECT_OUTCOME_EQ(encode(std::vector<int>{}), "80"_unhex);
}

/**
 * @given map with keys of different length
 * @when encode
 * @then shorter keys first, then bytewise
 */
TEST(Cbor, Map) {
  std::map<std::string, int> m;
  m["three"] = 3;
  m["one"] = 1;
  m["two"] = 2;
  EXPECT_OUTCOME_EQ(encode(m), "A3636F6E65016374776F0265746872656503"_unhex);
  EXPECT_OUTCOME_EQ((decode<std::map<std::string, int>>(
                        "A3636F6E65016374776F0265746872656503"_unhex)),
                    m);

  auto s{CborEncodeStream::map()};
  s["bb"] << 1;
  s["a"] << 2;
  EXPECT_EQ((CborEncodeStream{} << s).data(), "A261610262626201"_unhex);
}

/**
 * @given map without key
 * @when get key
 * @then kKeyNotFound
 */
TEST(Cbor, MapKeyNotFound) {
  CborDecodeStream s{"A1616101"_unhex};
  auto m{s.map()};
  int a{};
  CborDecodeStream::named(m, "a") >> a;
  EXPECT_EQ(a, 1);
  try {
    CborDecodeStream::named(m, "b");
    FAIL();
  } catch (const std::system_error &e) {
    EXPECT_EQ(e.code(), make_error_code(CborDecodeError::kKeyNotFound));
  }
}

/**
 * @given CID
 * @when encode decode
 * @then tag 42 with zero prefixed cid bytes
 */
TEST(Cbor, Cid) {
  const auto cid{makeCid(1)};
  auto expected{"D82A58250001711220"_unhex};
  expected.insert(expected.end(), 32, 1);
  EXPECT_OUTCOME_EQ(encode(cid), expected);
  EXPECT_OUTCOME_EQ(decode<CID>(expected), cid);
  EXPECT_OUTCOME_ERROR(CborDecodeError::kWrongType, decode<CID>("4100"_unhex));
}
