/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/cbor/cbor_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mk::codec::cbor, CborEncodeError, e) {
  using mk::codec::cbor::CborEncodeError;
  switch (e) {
    case CborEncodeError::kInvalidCID:
      return "CborEncodeError: invalid CID";
    case CborEncodeError::kExpectedMapValueSingle:
      return "CborEncodeError: map value must be single element";
  }
  return "CborEncodeError: unknown error";
}

OUTCOME_CPP_DEFINE_CATEGORY(mk::codec::cbor, CborDecodeError, e) {
  using mk::codec::cbor::CborDecodeError;
  switch (e) {
    case CborDecodeError::kInvalidCbor:
      return "CborDecodeError: invalid CBOR";
    case CborDecodeError::kWrongType:
      return "CborDecodeError: wrong type";
    case CborDecodeError::kIntOverflow:
      return "CborDecodeError: integer overflow";
    case CborDecodeError::kInvalidCID:
      return "CborDecodeError: invalid CID";
    case CborDecodeError::kWrongSize:
      return "CborDecodeError: wrong size";
    case CborDecodeError::kKeyNotFound:
      return "CborDecodeError: map key not found";
  }
  return "CborDecodeError: unknown error";
}
