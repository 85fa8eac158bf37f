/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "markets/storage/provider/ask_getter.hpp"

#include <gmock/gmock.h>

namespace mk::markets::storage::provider {

  class AskGetterMock : public AskGetter {
   public:
    MOCK_METHOD0(getAsk, SignedStorageAsk());
  };

}  // namespace mk::markets::storage::provider
