/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/mk_protocol.hpp"

#include <gtest/gtest.h>

#include "markets/storage/status_protocol.hpp"
#include "testutil/cid.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

namespace mk::markets::storage {
  using codec::cbor::CborDecodeError;

  DealParams makeDealParams() {
    DealParams params;
    params.deal_uuid.data[0] = 1;
    params.deal_uuid.data[15] = 2;
    auto &proposal{params.client_deal_proposal.proposal};
    proposal.piece_cid = makeCid(1);
    proposal.piece_size = PaddedPieceSize{2048};
    proposal.client = Address{101};
    proposal.provider = Address{1000};
    proposal.label = "label";
    proposal.start_epoch = 100;
    proposal.end_epoch = 200;
    proposal.storage_price_per_epoch = 5;
    proposal.client_collateral = -1;
    params.deal_data_root = makeCid(2);
    params.transfer = Transfer::make(
        TransferType::kHttp, {"http://h/data.car", {{"A", "b"}}}, 1024, "c");
    params.remove_unsealed_copy = true;
    params.skip_ipni_announce = true;
    return params;
  }

  /**
   * @given offline deal params
   * @when validate
   * @then transfer must be zero value
   */
  TEST(DealParamsTest, Offline) {
    DealParams params;
    params.is_offline = true;
    EXPECT_OUTCOME_TRUE_1(params.validate());

    params.transfer =
        Transfer::make(TransferType::kHttp, {"http://host/file", {}}, 10);
    EXPECT_OUTCOME_ERROR(DealParamsError::kOfflineDealWithTransfer,
                         params.validate());

    params.transfer = {};
    params.transfer.size = 10;
    EXPECT_OUTCOME_ERROR(DealParamsError::kOfflineDealWithTransfer,
                         params.validate());
  }

  /**
   * @given online deal params
   * @when validate
   * @then transfer type must be recognized
   */
  TEST(DealParamsTest, Online) {
    DealParams params;
    params.transfer =
        Transfer::make(TransferType::kLibp2p, {"libp2p://x", {}}, 10);
    EXPECT_OUTCOME_TRUE_1(params.validate());

    params.transfer.type = "graphsync";
    EXPECT_OUTCOME_ERROR(DealParamsError::kUnsupportedTransferType,
                         params.validate());

    params.transfer = {};
    EXPECT_OUTCOME_ERROR(DealParamsError::kUnsupportedTransferType,
                         params.validate());
  }

  /**
   * @given 1.2.0 proposal
   * @when convert to current params
   * @then fields are kept, announce is not skipped
   */
  TEST(DealParamsTest, FromV120) {
    DealParamsV120 old;
    old.deal_uuid.data[0] = 1;
    old.is_offline = false;
    old.deal_data_root = makeCid(4);
    old.transfer = Transfer::make(TransferType::kHttp, {"http://h", {}}, 3);
    old.remove_unsealed_copy = true;
    old.client_deal_proposal.proposal.label = "label";

    const auto params{old.toDealParams()};
    EXPECT_EQ(params.deal_uuid, old.deal_uuid);
    EXPECT_EQ(params.deal_data_root, old.deal_data_root);
    EXPECT_EQ(params.transfer, old.transfer);
    EXPECT_TRUE(params.remove_unsealed_copy);
    EXPECT_FALSE(params.skip_ipni_announce);
    EXPECT_TRUE(params.client_deal_proposal == old.client_deal_proposal);
  }

  /**
   * @given deal params
   * @when encode and decode cbor
   * @then same fields, same bytes after encoding again
   */
  TEST(DealParamsTest, Cbor) {
    const auto params{makeDealParams()};
    EXPECT_OUTCOME_TRUE(encoded, codec::cbor::encode(params));
    EXPECT_OUTCOME_TRUE(decoded, codec::cbor::decode<DealParams>(encoded));
    EXPECT_EQ(decoded.deal_uuid, params.deal_uuid);
    EXPECT_FALSE(decoded.is_offline);
    EXPECT_TRUE(decoded.client_deal_proposal == params.client_deal_proposal);
    EXPECT_EQ(decoded.deal_data_root, params.deal_data_root);
    EXPECT_EQ(decoded.transfer, params.transfer);
    EXPECT_TRUE(decoded.remove_unsealed_copy);
    EXPECT_TRUE(decoded.skip_ipni_announce);
    EXPECT_OUTCOME_EQ(codec::cbor::encode(decoded), encoded);
  }

  /**
   * @given current and 1.2.0 params
   * @when decode as other version
   * @then 1.2.0 ignores announce flag, current requires it
   */
  TEST(DealParamsTest, CborV120) {
    const auto params{makeDealParams()};
    EXPECT_OUTCOME_TRUE(encoded, codec::cbor::encode(params));
    EXPECT_OUTCOME_TRUE(old, codec::cbor::decode<DealParamsV120>(encoded));
    EXPECT_EQ(old.deal_uuid, params.deal_uuid);
    EXPECT_EQ(old.transfer, params.transfer);
    EXPECT_TRUE(old.remove_unsealed_copy);

    EXPECT_OUTCOME_TRUE(old_encoded, codec::cbor::encode(old));
    EXPECT_OUTCOME_ERROR(CborDecodeError::kKeyNotFound,
                         codec::cbor::decode<DealParams>(old_encoded));
    EXPECT_OUTCOME_TRUE(decoded_old,
                        codec::cbor::decode<DealParamsV120>(old_encoded));
    EXPECT_FALSE(decoded_old.toDealParams().skip_ipni_announce);
  }

  /**
   * @given transfer
   * @when encode and decode cbor
   * @then same transfer
   */
  TEST(TransferCborTest, Cbor) {
    const auto transfer{makeDealParams().transfer};
    EXPECT_OUTCOME_TRUE(encoded, codec::cbor::encode(transfer));
    EXPECT_OUTCOME_EQ(codec::cbor::decode<Transfer>(encoded), transfer);
    EXPECT_OUTCOME_EQ(codec::cbor::decode<Transfer>(
                          codec::cbor::encode(Transfer{}).value()),
                      Transfer{});
  }

  /**
   * @given deal responses
   * @when encode and decode cbor
   * @then map of message and accepted flag
   */
  TEST(DealResponseTest, Cbor) {
    EXPECT_OUTCOME_EQ(
        codec::cbor::encode(DealResponse::accept()),
        "A2674D65737361676560684163636570746564F5"_unhex);
    const auto rejected{DealResponse::reject("price too low")};
    EXPECT_OUTCOME_TRUE(encoded, codec::cbor::encode(rejected));
    EXPECT_OUTCOME_EQ(codec::cbor::decode<DealResponse>(encoded), rejected);
    EXPECT_OUTCOME_ERROR(CborDecodeError::kKeyNotFound,
                         codec::cbor::decode<DealResponse>("A0"_unhex));
  }

  /**
   * @given deal responses
   * @then rejection always has reason
   */
  TEST(DealResponseTest, AcceptReject) {
    const auto accepted{DealResponse::accept()};
    EXPECT_TRUE(accepted.accepted);
    EXPECT_EQ(accepted.message, "");

    const auto rejected{DealResponse::reject("price too low")};
    EXPECT_FALSE(rejected.accepted);
    EXPECT_EQ(rejected.message, "price too low");

    EXPECT_EQ(DealResponse::reject("").message, "deal proposal rejected");
  }

  /**
   * @given status request
   * @then signed bytes are raw uuid bytes
   */
  TEST(DealStatusRequestTest, Digest) {
    DealStatusRequest request;
    for (size_t i{0}; i < request.deal_uuid.size(); ++i) {
      request.deal_uuid.data[i] = static_cast<uint8_t>(i);
    }
    const auto digest{request.getDigest()};
    ASSERT_EQ(digest.size(), 16);
    for (size_t i{0}; i < digest.size(); ++i) {
      EXPECT_EQ(digest[i], i);
    }
  }

  /**
   * @given status request
   * @when encode and decode cbor
   * @then same uuid and signature
   */
  TEST(DealStatusRequestTest, Cbor) {
    DealStatusRequest request;
    request.deal_uuid.data[3] = 3;
    crypto::signature::Secp256k1Signature secp{};
    secp.fill(4);
    request.signature = secp;
    EXPECT_OUTCOME_TRUE(encoded, codec::cbor::encode(request));
    EXPECT_OUTCOME_TRUE(decoded,
                        codec::cbor::decode<DealStatusRequest>(encoded));
    EXPECT_EQ(decoded.deal_uuid, request.deal_uuid);
    EXPECT_TRUE(decoded.signature == request.signature);
  }

  /**
   * @given status responses with and without deal status
   * @when encode and decode cbor
   * @then same fields, same bytes after encoding again
   */
  TEST(DealStatusResponseTest, Cbor) {
    DealStatusResponse response;
    response.deal_uuid.data[0] = 9;
    response.error = "deal not found";
    EXPECT_OUTCOME_TRUE(encoded, codec::cbor::encode(response));
    EXPECT_OUTCOME_TRUE(decoded,
                        codec::cbor::decode<DealStatusResponse>(encoded));
    EXPECT_EQ(decoded.error, response.error);
    EXPECT_FALSE(decoded.deal_status);

    DealStatus status;
    status.status = "Sealing";
    status.sealing_status = "PreCommit1";
    status.proposal = makeDealParams().client_deal_proposal.proposal;
    status.signed_proposal_cid = makeCid(5);
    status.publish_cid = makeCid(6);
    status.chain_deal_id = 42;
    response.error.clear();
    response.deal_status = status;
    response.is_offline = true;
    response.transfer_size = 1024;
    response.n_bytes_received = 512;
    EXPECT_OUTCOME_TRUE(full, codec::cbor::encode(response));
    EXPECT_OUTCOME_TRUE(decoded_full,
                        codec::cbor::decode<DealStatusResponse>(full));
    ASSERT_TRUE(decoded_full.deal_status);
    EXPECT_EQ(decoded_full.deal_status->status, "Sealing");
    EXPECT_EQ(decoded_full.deal_status->proposal, status.proposal);
    EXPECT_EQ(decoded_full.deal_status->publish_cid.value_or(CID{}),
              makeCid(6));
    EXPECT_EQ(decoded_full.deal_status->chain_deal_id, 42);
    EXPECT_TRUE(decoded_full.is_offline);
    EXPECT_EQ(decoded_full.transfer_size, 1024);
    EXPECT_EQ(decoded_full.n_bytes_received, 512);
    EXPECT_OUTCOME_EQ(codec::cbor::encode(decoded_full), full);
  }

  /**
   * @given protocol ids
   * @then versions match wire names
   */
  TEST(DealProtocolTest, Ids) {
    EXPECT_EQ(kDealProtocolId_v1_2_0, "/fil/storage/mk/1.2.0");
    EXPECT_EQ(kDealProtocolId_v1_2_1, "/fil/storage/mk/1.2.1");
    EXPECT_EQ(kDealStatusProtocolId_v1_2_0, "/fil/storage/status/1.2.0");
  }
}  // namespace mk::markets::storage
