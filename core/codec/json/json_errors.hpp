/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace mk::codec::json {
  enum class JsonError {
    kParseError = 1,
    kWrongType,
    kOutOfRange,
  };
}  // namespace mk::codec::json

OUTCOME_HPP_DECLARE_ERROR(mk::codec::json, JsonError);
