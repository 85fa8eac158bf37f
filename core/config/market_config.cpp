/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "config/market_config.hpp"

namespace mk::config {
  namespace po = boost::program_options;

  namespace {
    common::Logger log() {
      static common::Logger logger{common::createLogger("config")};
      return logger;
    }

    outcome::result<TokenAmount> parsePrice(const std::string &value) {
      try {
        TokenAmount price{value};
        if (price < 0) {
          return MarketConfigError::kInvalidPrice;
        }
        return price;
      } catch (std::runtime_error &e) {
        log()->error("invalid price '{}': {}", value, e.what());
        return MarketConfigError::kInvalidPrice;
      }
    }
  }  // namespace

  options_description configMarket() {
    MarketConfig defaults;
    options_description desc("Market options");
    auto option{desc.add_options()};
    option("ask.price",
           po::value<std::string>()->default_value(defaults.ask_price.str()),
           "ask price per GiB per epoch");
    option("ask.verified-price",
           po::value<std::string>()->default_value(
               defaults.ask_verified_price.str()),
           "ask price per GiB per epoch of verified deals");
    option("ask.min-piece-size",
           po::value<uint64_t>()->default_value(defaults.min_piece_size),
           "min padded piece size");
    option("ask.max-piece-size",
           po::value<uint64_t>()->default_value(defaults.max_piece_size),
           "max padded piece size");
    option("log", po::value<char>()->default_value('i'), "log level, [e,w,i,d,t]");
    return desc;
  }

  outcome::result<MarketConfig> MarketConfig::read(std::istream &stream) {
    po::variables_map vm;
    try {
      po::store(po::parse_config_file(stream, configMarket()), vm);
      po::notify(vm);
    } catch (const po::error &e) {
      log()->error("cannot read market config: {}", e.what());
      return MarketConfigError::kInvalidOption;
    }

    MarketConfig config;
    OUTCOME_TRYA(config.ask_price,
                 parsePrice(vm["ask.price"].as<std::string>()));
    OUTCOME_TRYA(config.ask_verified_price,
                 parsePrice(vm["ask.verified-price"].as<std::string>()));
    config.min_piece_size = vm["ask.min-piece-size"].as<uint64_t>();
    config.max_piece_size = vm["ask.max-piece-size"].as<uint64_t>();
    if (config.min_piece_size.validate().has_error()
        || config.max_piece_size.validate().has_error()
        || config.min_piece_size > config.max_piece_size) {
      log()->error("invalid piece size bounds {}..{}",
                   static_cast<uint64_t>(config.min_piece_size),
                   static_cast<uint64_t>(config.max_piece_size));
      return MarketConfigError::kInvalidPieceSize;
    }
    const auto level{common::logLevelFromChar(vm["log"].as<char>())};
    if (!level) {
      return MarketConfigError::kInvalidLogLevel;
    }
    config.log_level = *level;
    return config;
  }

  StorageAsk MarketConfig::defaultAsk() const {
    StorageAsk ask;
    ask.price = ask_price;
    ask.verified_price = ask_verified_price;
    ask.min_piece_size = min_piece_size;
    ask.max_piece_size = max_piece_size;
    return ask;
  }

  void MarketConfig::setupLogging() const {
    spdlog::set_level(log_level);
  }
}  // namespace mk::config

OUTCOME_CPP_DEFINE_CATEGORY(mk::config, MarketConfigError, e) {
  using E = mk::config::MarketConfigError;
  switch (e) {
    case E::kInvalidOption:
      return "MarketConfigError: invalid option";
    case E::kInvalidPrice:
      return "MarketConfigError: price must be non-negative integer";
    case E::kInvalidPieceSize:
      return "MarketConfigError: piece sizes must be powers of 2, min not "
             "above max";
    case E::kInvalidLogLevel:
      return "MarketConfigError: log level must be one of e,w,i,d,t";
  }
  return "MarketConfigError: unknown error";
}
