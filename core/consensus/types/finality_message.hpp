/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/types/finality_justification.hpp"
#include "primitives/common.hpp"

namespace singleton::consensus {
  /**
   * Unit of finality gossip
   */
  struct FinalityMessage {
    primitives::BlockHash block_hash;
    FinalityJustification justification;

    bool operator==(const FinalityMessage &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const FinalityMessage &msg) {
    return s << msg.block_hash << msg.justification;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, FinalityMessage &msg) {
    return s >> msg.block_hash >> msg.justification;
  }
}  // namespace singleton::consensus
