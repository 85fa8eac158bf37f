/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/outcome.hpp"

namespace mk::common {
  enum class PercentEncodingError {
    kTruncatedEscape = 1,
    kInvalidEscape,
  };

  class PercentEncoding final {
   public:
    /**
     * Escapes path for use in url, keeps unreserved characters, '/' and
     * sub-delimiters allowed in path
     */
    static std::string encodePath(std::string_view input);

    /**
     * Path unescape: every '%' must start a two hex digit escape, '+' is kept
     * as is
     */
    static outcome::result<std::string> decode(std::string_view input);
  };
}  // namespace mk::common

OUTCOME_HPP_DECLARE_ERROR(mk::common, PercentEncodingError);
