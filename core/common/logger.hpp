/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>
#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace mk::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object, the same one for the same tag
   */
  Logger createLogger(const std::string &tag);

  /**
   * Maps one-letter level of config and command line ([e,w,i,d,t]) to spdlog
   * level
   * @return level, none for unknown letter
   */
  boost::optional<spdlog::level::level_enum> logLevelFromChar(char level);
}  // namespace mk::common
