/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "codec/cbor/cbor.hpp"
#include "codec/json/coding.hpp"
#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace mk::markets::storage {
  enum class TransferType {
    kHttp,
    kLibp2p,
  };

  const std::string kTransferTypeHttp{"http"};
  const std::string kTransferTypeLibp2p{"libp2p"};

  /** Wire tag of transfer type */
  const std::string &transferTypeTag(TransferType type);

  /** @return none for unrecognized tag */
  boost::optional<TransferType> transferTypeFromTag(std::string_view tag);

  /**
   * Transport parameters of http and libp2p transfers
   */
  struct HttpRequest {
    /** Http url or libp2p://<multiaddr>/p2p/<peer id> */
    std::string url;
    std::map<std::string, std::string> headers;
  };

  inline bool operator==(const HttpRequest &lhs, const HttpRequest &rhs) {
    return lhs.url == rhs.url && lhs.headers == rhs.headers;
  }

  /** Typed view of transfer parameters */
  struct TransferParams {
    TransferType type{};
    HttpRequest request;
  };

  /**
   * Parameters of data transfer
   */
  struct Transfer {
    /** Transfer type tag, e.g. "http" */
    std::string type;
    /** Optional id supplied by client to identify the deal */
    std::string client_id;
    /** Json encoded transport parameters, meaning depends on type */
    Bytes params;
    /** Size of transferred data in bytes */
    uint64_t size{};

    /** Builds transfer with json encoded request */
    static Transfer make(TransferType type,
                         const HttpRequest &request,
                         uint64_t size,
                         std::string client_id = {});

    /** Zero value is used for offline deals */
    bool isZero() const;

    /**
     * Decodes transport parameters.
     * Cause and offending params are logged at debug level ("transfer"
     * logger), returned error carries only the code.
     * @return kUnsupportedTransferType or kTransferParamsInvalid on failure
     */
    outcome::result<TransferParams> decodeParams() const;

    /**
     * Host the transfer will connect to, no network io.
     * Http port is kept as written in url. Parse failure is logged at debug
     * level with url and cause, returned error carries only the code.
     * @return "host", "host:port" or "[ip6]:port", kTransferUrlInvalid or
     * kAddressResolution on failure, or decodeParams() error
     */
    outcome::result<std::string> host() const;
  };

  inline bool operator==(const Transfer &lhs, const Transfer &rhs) {
    return lhs.type == rhs.type && lhs.client_id == rhs.client_id
           && lhs.params == rhs.params && lhs.size == rhs.size;
  }
  MK_OPERATOR_NOT_EQUAL(Transfer)

  inline CBOR2_ENCODE(Transfer) {
    auto m{codec::cbor::CborEncodeStream::map()};
    m["Type"] << v.type;
    m["ClientID"] << v.client_id;
    m["Params"] << v.params;
    m["Size"] << v.size;
    return s << m;
  }

  inline CBOR2_DECODE(Transfer) {
    using codec::cbor::CborDecodeStream;
    auto m{s.map()};
    CborDecodeStream::named(m, "Type") >> v.type;
    CborDecodeStream::named(m, "ClientID") >> v.client_id;
    CborDecodeStream::named(m, "Params") >> v.params;
    CborDecodeStream::named(m, "Size") >> v.size;
    return s;
  }

  JSON_ENCODE(HttpRequest) {
    using codec::json::Set;
    mk::codec::json::Value j{rapidjson::kObjectType};
    Set(j, "URL", v.url, allocator);
    Set(j, "Headers", v.headers, allocator);
    return j;
  }

  JSON_DECODE(HttpRequest) {
    using codec::json::FindCaseless;
    using codec::json::GetCaseless;
    GetCaseless(j, "URL", v.url);
    if (const auto headers{FindCaseless(j, "Headers")}) {
      codec::json::decode(v.headers, *headers);
    }
  }
}  // namespace mk::markets::storage
