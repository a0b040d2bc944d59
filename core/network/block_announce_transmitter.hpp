/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/types/block_announce.hpp"

namespace singleton::network {

  /// Outgoing side of block propagation, used by the block author
  class BlockAnnounceTransmitter {
   public:
    virtual ~BlockAnnounceTransmitter() = default;

    /// Gossips a sealed block with its body to all peers
    virtual void blockAnnounce(BlockAnnounce &&announce) = 0;
  };

}  // namespace singleton::network
