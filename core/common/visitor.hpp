/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant/apply_visitor.hpp>
#include <utility>

namespace mk {
  template <typename... Fs>
  struct Overloaded : Fs... {
    using Fs::operator()...;
  };
  template <typename... Fs>
  Overloaded(Fs...) -> Overloaded<Fs...>;

  /**
   * Visits boost::variant with set of lambdas
   * @code
   * visit_in_place(variant,
   *                [](const A &a) { ... },
   *                [](const auto &other) { ... });
   * @endcode
   */
  template <typename Variant, typename... Visitors>
  decltype(auto) visit_in_place(Variant &&variant, Visitors &&...visitors) {
    return boost::apply_visitor(
        Overloaded{std::forward<Visitors>(visitors)...},
        std::forward<Variant>(variant));
  }
}  // namespace mk
