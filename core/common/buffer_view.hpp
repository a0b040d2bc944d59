/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <compare>
#include <ostream>
#include <span>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace singleton::common {

  /**
   * Non-owning view of bytes: encoded payloads, hashes being signed, parts of
   * a header
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    std::string toHex() const {
      return hex_lower(*this);
    }

    auto operator<=>(const BufferView &other) const {
      return std::lexicographical_compare_three_way(
          begin(), end(), other.begin(), other.end());
    }

    bool operator==(const BufferView &other) const {
      return std::equal(begin(), end(), other.begin(), other.end());
    }
  };

  inline std::ostream &operator<<(std::ostream &os, BufferView view) {
    return os << hex_lower_0x(view);
  }

  /**
   * Formatter of byte sequences: `{}` and `{:s}` print the abbreviated form,
   * `{:l}` all the bytes
   */
  struct BytesFormatter {
    bool full = false;

    constexpr auto parse(fmt::format_parse_context &ctx)
        -> decltype(ctx.begin()) {
      auto it = ctx.begin();
      if (it != ctx.end() and (*it == 'l' or *it == 's')) {
        full = *it++ == 'l';
      }
      if (it != ctx.end() and *it != '}') {
        throw fmt::format_error("invalid format");
      }
      return it;
    }

    template <typename FormatContext>
    auto format(BufferView view, FormatContext &ctx) const
        -> decltype(ctx.out()) {
      if (view.empty()) {
        return fmt::format_to(ctx.out(), "<empty>");
      }
      return fmt::format_to(
          ctx.out(), "{}", full ? hex_lower_0x(view) : hex_short_0x(view));
    }
  };

}  // namespace singleton::common

namespace singleton {
  using common::BufferView;
}  // namespace singleton

template <>
struct fmt::formatter<singleton::common::BufferView>
    : singleton::common::BytesFormatter {};
