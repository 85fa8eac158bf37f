/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/provider/stored_ask.hpp"

namespace mk::markets::storage::provider {

  outcome::result<std::shared_ptr<StoredAsk>> StoredAsk::newStoredAsk(
      Address actor_address,
      StorageAsk default_ask,
      ChainEpoch now,
      AskSigner signer) {
    struct make_unique_enabler : StoredAsk {
      make_unique_enabler(Address actor_address, AskSigner signer)
          : StoredAsk(std::move(actor_address), std::move(signer)){};
    };

    std::shared_ptr<StoredAsk> stored_ask =
        std::make_shared<make_unique_enabler>(actor_address, std::move(signer));

    default_ask.miner = std::move(actor_address);
    OUTCOME_TRY(stored_ask->addAsk(std::move(default_ask), now,
                                   kDefaultAskDuration));
    return stored_ask;
  }

  StoredAsk::StoredAsk(Address actor_address, AskSigner signer)
      : actor_{std::move(actor_address)},
        signer_{std::move(signer)},
        logger_{common::createLogger("stored_ask")} {}

  outcome::result<void> StoredAsk::addAsk(StorageAsk ask,
                                          ChainEpoch now,
                                          EpochDuration duration) {
    if (ask.miner != actor_) {
      return StoredAskError::kWrongAddress;
    }
    if (duration <= 0) {
      return StoredAskError::kInvalidDuration;
    }
    OUTCOME_TRY(ask.validate());

    std::lock_guard update_lock{update_mutex_};
    ask.timestamp = now;
    ask.expiry = now + duration;
    {
      std::lock_guard lock{mutex_};
      ask.seq_no = last_signed_storage_ask_
                       ? last_signed_storage_ask_->ask.seq_no + 1
                       : 0;
    }

    SignedStorageAsk signed_ask{std::move(ask), {}};
    OUTCOME_TRY(digest, signed_ask.getDigest());
    OUTCOME_TRYA(signed_ask.signature, signer_(digest));

    logger_->info("new ask {}, price {}, verified price {}",
                  signed_ask.ask.seq_no,
                  signed_ask.ask.price.str(),
                  signed_ask.ask.verified_price.str());
    std::lock_guard lock{mutex_};
    last_signed_storage_ask_ = std::move(signed_ask);
    return outcome::success();
  }

  outcome::result<void> StoredAsk::addAsk(const TokenAmount &price,
                                          const TokenAmount &verified_price,
                                          ChainEpoch now,
                                          EpochDuration duration) {
    StorageAsk ask{getAsk().ask};
    ask.price = price;
    ask.verified_price = verified_price;
    return addAsk(std::move(ask), now, duration);
  }

  SignedStorageAsk StoredAsk::getAsk() {
    std::lock_guard lock{mutex_};
    return *last_signed_storage_ask_;
  }

}  // namespace mk::markets::storage::provider

OUTCOME_CPP_DEFINE_CATEGORY(mk::markets::storage::provider, StoredAskError, e) {
  using E = mk::markets::storage::provider::StoredAskError;
  switch (e) {
    case E::kWrongAddress:
      return "StoredAskError: wrong address";
    case E::kInvalidDuration:
      return "StoredAskError: ask duration must be positive";
  }
  return "StoredAskError: unknown error";
}
