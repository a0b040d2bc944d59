/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/block_announce_observer.hpp"

#include <memory>

#include "consensus/import_queue.hpp"
#include "log/logger.hpp"
#include "network/gossip_transport.hpp"

namespace singleton::network {

  /**
   * Passes announced blocks to the import queue
   */
  class BlockAnnounceObserverImpl final
      : public BlockAnnounceObserver,
        public std::enable_shared_from_this<BlockAnnounceObserverImpl> {
   public:
    BlockAnnounceObserverImpl(
        std::shared_ptr<GossipTransport> transport,
        std::shared_ptr<consensus::ImportQueue> import_queue,
        std::shared_ptr<crypto::Hasher> hasher);

    /// Subscribes to the block announce topic
    void start();

    void onBlockAnnounce(const libp2p::peer::PeerId &peer_id,
                         const BlockAnnounce &announce) override;

   private:
    void onMessage(const TopicNotification &notification);

    std::shared_ptr<GossipTransport> transport_;
    std::shared_ptr<consensus::ImportQueue> import_queue_;
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger log_;
  };

}  // namespace singleton::network
