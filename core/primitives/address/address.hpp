/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <boost/variant.hpp>
#include <cstdint>

#include "common/outcome.hpp"
#include "primitives/types.hpp"

namespace mk::primitives::address {
  /**
   * @brief Potential errors creating and handling addresses
   */
  enum class AddressError {
    kUnknownProtocol = 1, /**< Unknown Address protocol/type */
    kInvalidPayload,      /**< Invalid data for a given protocol */
  };

  /**
   * @brief Known Address protocols
   */
  enum Protocol : uint8_t { ID = 0x0, SECP256K1 = 0x1, ACTOR = 0x2, BLS = 0x3 };

  struct Secp256k1PublicKeyHash : public std::array<uint8_t, 20> {};

  struct ActorExecHash : public std::array<uint8_t, 20> {};

  struct BLSPublicKeyHash : public std::array<uint8_t, 48> {};

  /** Order of alternatives matches Protocol values */
  using Payload = boost::variant<ActorId,
                                 Secp256k1PublicKeyHash,
                                 ActorExecHash,
                                 BLSPublicKeyHash>;

  /**
   * @brief Address refers to an actor in the chain state
   */
  struct Address {
    Address() = default;

    Address(ActorId id) : data{id} {}  // NOLINT

    Address(const Secp256k1PublicKeyHash &hash) : data{hash} {}  // NOLINT

    Address(const ActorExecHash &hash) : data{hash} {}  // NOLINT

    Address(const BLSPublicKeyHash &hash) : data{hash} {}  // NOLINT

    /**
     * @brief Returns the address protocol: ID, Secp256k1, ACTOR or BLS
     */
    Protocol getProtocol() const;

    /**
     * @return true if the address represents a public key
     */
    bool isKeyType() const;

    bool isId() const;

    ActorId getId() const;

    Payload data;
  };

  bool operator==(const Address &lhs, const Address &rhs);

  bool operator!=(const Address &lhs, const Address &rhs);

  bool operator<(const Address &lhs, const Address &rhs);

}  // namespace mk::primitives::address

OUTCOME_HPP_DECLARE_ERROR(mk::primitives::address, AddressError);
