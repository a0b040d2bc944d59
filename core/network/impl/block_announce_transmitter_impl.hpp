/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/block_announce_transmitter.hpp"

#include <memory>

#include "log/logger.hpp"
#include "network/gossip_transport.hpp"

namespace singleton::network {

  class BlockAnnounceTransmitterImpl final : public BlockAnnounceTransmitter {
   public:
    BlockAnnounceTransmitterImpl(std::shared_ptr<GossipTransport> transport,
                                 std::shared_ptr<crypto::Hasher> hasher);

    void blockAnnounce(BlockAnnounce &&announce) override;

   private:
    std::shared_ptr<GossipTransport> transport_;
    std::shared_ptr<crypto::Hasher> hasher_;
    Topic topic_;
    log::Logger log_;
  };

}  // namespace singleton::network
