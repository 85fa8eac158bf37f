/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/address/address.hpp"

#include "common/visitor.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(mk::primitives::address, AddressError, e) {
  using mk::primitives::address::AddressError;
  switch (e) {
    case (AddressError::kUnknownProtocol):
      return "Failed to create address: unknown address protocol";
    case (AddressError::kInvalidPayload):
      return "Failed to create address: invalid payload for the specified "
             "protocol";
  }
  return "Failed to create address: unknown error";
}

namespace mk::primitives::address {

  bool Address::isKeyType() const {
    return visit_in_place(
        data,
        [](const Secp256k1PublicKeyHash &) { return true; },
        [](const BLSPublicKeyHash &) { return true; },
        [](const auto &) { return false; });
  }

  Protocol Address::getProtocol() const {
    return static_cast<Protocol>(data.which());
  }

  bool Address::isId() const {
    return boost::get<ActorId>(&data) != nullptr;
  }

  ActorId Address::getId() const {
    return boost::get<ActorId>(data);
  }

  bool operator==(const Address &lhs, const Address &rhs) {
    return lhs.data == rhs.data;
  }

  bool operator!=(const Address &lhs, const Address &rhs) {
    return !(lhs == rhs);
  }

  bool operator<(const Address &lhs, const Address &rhs) {
    return lhs.data < rhs.data;
  }

}  // namespace mk::primitives::address
