/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <fmt/format.h>
#include <libp2p/peer/peer_id.hpp>

/// `{}` and `{:s}` print "…" and the tail of the base58 form, `{:l}` prints
/// it whole
template <>
struct fmt::formatter<libp2p::peer::PeerId> {
  static constexpr size_t kTailLength = 6;

  bool full = false;

  constexpr auto parse(format_parse_context &ctx) {
    auto it = ctx.begin();
    if (it != ctx.end() and (*it == 'l' or *it == 's')) {
      full = *it++ == 'l';
    }
    if (it != ctx.end() and *it != '}') {
      throw format_error("invalid format of peer id");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const libp2p::peer::PeerId &peer_id, FormatContext &ctx) const {
    const auto b58 = peer_id.toBase58();
    std::string_view view{b58};
    if (full or view.size() <= kTailLength) {
      return fmt::format_to(ctx.out(), "{}", view);
    }
    return fmt::format_to(
        ctx.out(), "…{}", view.substr(view.size() - kTailLength));
  }
};
