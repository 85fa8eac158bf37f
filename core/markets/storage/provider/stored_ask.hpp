/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include "common/logger.hpp"
#include "markets/storage/provider/ask_getter.hpp"

namespace mk::markets::storage::provider {
  using primitives::EpochDuration;

  /** Signs ask digest with miner worker key */
  using AskSigner = std::function<outcome::result<Signature>(BytesIn digest)>;

  constexpr EpochDuration kDefaultAskDuration = 1'000'000;

  /**
   * Storage for the latest ask of provider.
   */
  class StoredAsk : public AskGetter {
   public:
    /**
     * Creates storage with default ask
     * @param default_ask - ask terms, miner is set to actor_address
     */
    static outcome::result<std::shared_ptr<StoredAsk>> newStoredAsk(
        Address actor_address,
        StorageAsk default_ask,
        ChainEpoch now,
        AskSigner signer);

    /**
     * Validates, stamps and signs new ask.
     * Signer is called without holding the ask lock, so it may read current
     * ask. Concurrent updates are applied one at a time.
     * @param ask - terms, timestamp, expiry and seq_no are overwritten
     * @param now - current chain epoch
     * @param duration - ask lifetime in epochs
     */
    outcome::result<void> addAsk(StorageAsk ask,
                                 ChainEpoch now,
                                 EpochDuration duration);

    /**
     * Changes prices keeping piece size bounds of the latest ask
     */
    outcome::result<void> addAsk(const TokenAmount &price,
                                 const TokenAmount &verified_price,
                                 ChainEpoch now,
                                 EpochDuration duration);

    SignedStorageAsk getAsk() override;

   private:
    StoredAsk(Address actor_address, AskSigner signer);

    /** Held through whole update including signing */
    std::mutex update_mutex_;
    /** Guards last ask */
    std::mutex mutex_;
    boost::optional<SignedStorageAsk> last_signed_storage_ask_;
    Address actor_;
    AskSigner signer_;
    common::Logger logger_;
  };

  enum class StoredAskError { kWrongAddress = 1, kInvalidDuration };

}  // namespace mk::markets::storage::provider

OUTCOME_HPP_DECLARE_ERROR(mk::markets::storage::provider, StoredAskError);
