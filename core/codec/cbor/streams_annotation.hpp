/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>

#define CBOR_ENCODE(type, var)                                            \
  template <class Stream,                                                 \
            typename = std::enable_if_t<                                  \
                std::remove_reference_t<Stream>::is_cbor_encoder_stream>> \
  Stream &operator<<(Stream &&s,                                          \
                     const type &var)  // NOLINT(bugprone-macro-parentheses)

#define CBOR_DECODE(type, var)                                            \
  template <class Stream,                                                 \
            typename = std::enable_if_t<                                  \
                std::remove_reference_t<Stream>::is_cbor_decoder_stream>> \
  Stream &operator>>(Stream &&s,                                          \
                     type &var)  // NOLINT(bugprone-macro-parentheses)

#define CBOR2_DECODE(...)                          \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */ \
  mk::codec::cbor::CborDecodeStream &operator>>(   \
      mk::codec::cbor::CborDecodeStream &s, __VA_ARGS__ &v)
#define CBOR2_ENCODE(...)                        \
  mk::codec::cbor::CborEncodeStream &operator<<( \
      mk::codec::cbor::CborEncodeStream &s, const __VA_ARGS__ &v)
#define CBOR2_DECODE_ENCODE(...) \
  CBOR2_DECODE(__VA_ARGS__);     \
  CBOR2_ENCODE(__VA_ARGS__);

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_1(op, m) op t.m
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_2(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_1(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_3(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_2(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_4(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_3(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_5(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_4(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_6(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_5(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_7(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_6(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_8(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_7(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_9(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_8(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_10(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_9(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_11(op, m, ...) \
  _CBOR_TUPLE_1(op, m) _CBOR_TUPLE_10(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE_V(_1, \
                      _2, \
                      _3, \
                      _4, \
                      _5, \
                      _6, \
                      _7, \
                      _8, \
                      _9, \
                      _10, \
                      _11, \
                      f,   \
                      ...) \
  f
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _CBOR_TUPLE(op, ...)    \
  _CBOR_TUPLE_V(__VA_ARGS__,    \
                _CBOR_TUPLE_11, \
                _CBOR_TUPLE_10, \
                _CBOR_TUPLE_9, \
                _CBOR_TUPLE_8, \
                _CBOR_TUPLE_7, \
                _CBOR_TUPLE_6, \
                _CBOR_TUPLE_5, \
                _CBOR_TUPLE_4, \
                _CBOR_TUPLE_3, \
                _CBOR_TUPLE_2, \
                _CBOR_TUPLE_1)  \
  (op, __VA_ARGS__)

/** Encodes fields as list in order given */
#define CBOR_TUPLE(T, ...)                        \
  CBOR_ENCODE(T, t) {                             \
    auto l{s.list()};                             \
    return s << (l _CBOR_TUPLE(<<, __VA_ARGS__)); \
  }                                               \
  CBOR_DECODE(T, t) {                             \
    auto l{s.list()};                             \
    l _CBOR_TUPLE(>>, __VA_ARGS__);               \
    return s;                                     \
  }

namespace mk::codec::cbor {
  class CborDecodeStream;
  class CborEncodeStream;
}  // namespace mk::codec::cbor
