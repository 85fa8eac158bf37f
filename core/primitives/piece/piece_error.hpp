/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace mk::primitives::piece {

  /**
   * @brief Pieces returns these types of errors
   */
  enum class PieceError {
    kLessThatMinimumSize = 1,
    kLessThatMinimumPaddedSize,
    kInvalidUnpaddedSize,
    kInvalidPaddedSize,
    kCannotOpenFile,
  };

}  // namespace mk::primitives::piece

OUTCOME_HPP_DECLARE_ERROR(mk::primitives::piece, PieceError);
