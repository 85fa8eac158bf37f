/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mk::codec::json, JsonError, e) {
  using E = mk::codec::json::JsonError;
  switch (e) {
    case E::kParseError:
      return "malformed json";
    case E::kWrongType:
      return "wrong type";
    case E::kOutOfRange:
      return "out of range";
  }

  return "unknown JsonError error code";
}
