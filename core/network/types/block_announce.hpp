/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "primitives/block.hpp"

namespace singleton::network {

  /// Topic of block announcements is the hash of this string
  constexpr std::string_view kBlockAnnounceTopic = "singleton-blocks";

  /// Announce a new complete block on the network.
  struct BlockAnnounce {
    /// New block header, sealed
    primitives::BlockHeader header;
    primitives::BlockBody body{};

    bool operator==(const BlockAnnounce &other) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockAnnounce &v) {
    return s << v.header << v.body;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockAnnounce &v) {
    return s >> v.header >> v.body;
  }

}  // namespace singleton::network
