/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/peer/peer_id.hpp>

#include "network/types/block_announce.hpp"

namespace singleton::network {

  /// Incoming side of block propagation
  class BlockAnnounceObserver {
   public:
    virtual ~BlockAnnounceObserver() = default;

    /// A decoded announce from `peer_id`; the block is not verified yet
    virtual void onBlockAnnounce(const libp2p::peer::PeerId &peer_id,
                                 const BlockAnnounce &announce) = 0;
  };

}  // namespace singleton::network
