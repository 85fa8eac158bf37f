/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace mk::common {
  namespace {
    constexpr auto kPattern{"%Y-%m-%d %H:%M:%S.%e [%n] %^%l%$ %v"};
  }  // namespace

  Logger createLogger(const std::string &tag) {
    static std::mutex mutex;
    std::lock_guard lock{mutex};
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      logger = spdlog::stdout_color_mt(tag);
      logger->set_pattern(kPattern);
    }
    return logger;
  }

  boost::optional<spdlog::level::level_enum> logLevelFromChar(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'i':
        return spdlog::level::info;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
      default:
        return boost::none;
    }
  }
}  // namespace mk::common
