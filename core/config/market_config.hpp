/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/program_options.hpp>
#include <istream>

#include "common/logger.hpp"
#include "markets/storage/ask.hpp"

namespace mk::config {
  using boost::program_options::options_description;
  using markets::storage::StorageAsk;
  using primitives::TokenAmount;
  using primitives::piece::PaddedPieceSize;

  enum class MarketConfigError {
    kInvalidOption = 1,
    kInvalidPrice,
    kInvalidPieceSize,
    kInvalidLogLevel,
  };

  /**
   * Creates program option description of market section:
   * ask.price, ask.verified-price, ask.min-piece-size, ask.max-piece-size, log
   */
  options_description configMarket();

  /**
   * Provider market defaults
   */
  struct MarketConfig {
    /** Price per GiB per epoch */
    TokenAmount ask_price{500'000'000};
    TokenAmount ask_verified_price{50'000'000};
    PaddedPieceSize min_piece_size{256};
    PaddedPieceSize max_piece_size{uint64_t{32} << 30};
    spdlog::level::level_enum log_level{spdlog::level::info};

    /**
     * Reads ini-style config, missing options keep defaults
     */
    static outcome::result<MarketConfig> read(std::istream &stream);

    /** Ask terms without miner and stamps */
    StorageAsk defaultAsk() const;

    /** Sets log level of all loggers */
    void setupLogging() const;
  };
}  // namespace mk::config

OUTCOME_HPP_DECLARE_ERROR(mk::config, MarketConfigError);
