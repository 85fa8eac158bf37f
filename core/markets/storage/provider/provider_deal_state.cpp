/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "markets/storage/provider/provider_deal_state.hpp"

namespace mk::markets::storage::provider {
  std::string_view checkpointName(Checkpoint checkpoint) {
    switch (checkpoint) {
      case Checkpoint::kAccepted:
        return "Accepted";
      case Checkpoint::kTransferred:
        return "Transferred";
      case Checkpoint::kPublished:
        return "Published";
      case Checkpoint::kPublishConfirmed:
        return "PublishConfirmed";
      case Checkpoint::kAddedPiece:
        return "AddedPiece";
      case Checkpoint::kIndexedAndAnnounced:
        return "IndexedAndAnnounced";
      case Checkpoint::kComplete:
        return "Complete";
    }
    return "Unknown";
  }
}  // namespace mk::markets::storage::provider
