/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/multi/content_identifier.hpp>
#include <spdlog/fmt/fmt.h>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace mk {
  class CID : public libp2p::multi::ContentIdentifier {
   public:
    using ContentIdentifier::ContentIdentifier;

    using Multicodec = libp2p::multi::MulticodecType::Code;

    /**
     * ContentIdentifier is not default-constructable, but in some cases we need
     * default value. This value can be used to initialize class member or local
     * variable. Trying to encode this value will yield error, to ensure
     * proper initialization.
     */
    CID();

    explicit CID(const ContentIdentifier &cid);

    explicit CID(ContentIdentifier &&cid) noexcept;

    CID(CID &&cid) noexcept;

    CID(const CID &cid) = default;

    CID(Version version,
        Multicodec content_type,
        libp2p::multi::Multihash content_address);

    ~CID() = default;

    CID &operator=(const CID &) = default;

    CID &operator=(CID &&cid) noexcept;

    /**
     * @brief string-encodes cid
     * @return encoded value or error
     */
    outcome::result<std::string> toString() const;

    /**
     * @brief encodes CID to bytes
     * @return byte-representation of CID
     */
    outcome::result<Bytes> toBytes() const;

    static outcome::result<CID> fromBytes(BytesIn input);
  };
}  // namespace mk

template <>
struct fmt::formatter<mk::CID> : formatter<std::string_view> {
  template <typename C>
  auto format(const mk::CID &cid, C &ctx) const {
    auto str{cid.toString()};
    return formatter<std::string_view>::format(
        str ? std::string_view{str.value()} : std::string_view{"<empty cid>"},
        ctx);
  }
};
