/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/impl/block_announce_observer_impl.hpp"

#include <boost/assert.hpp>

namespace singleton::network {

  BlockAnnounceObserverImpl::BlockAnnounceObserverImpl(
      std::shared_ptr<GossipTransport> transport,
      std::shared_ptr<consensus::ImportQueue> import_queue,
      std::shared_ptr<crypto::Hasher> hasher)
      : transport_{std::move(transport)},
        import_queue_{std::move(import_queue)},
        hasher_{std::move(hasher)},
        log_{log::createLogger("BlockAnnounceObserver", "block_announce")} {
    BOOST_ASSERT(transport_);
    BOOST_ASSERT(import_queue_);
    BOOST_ASSERT(hasher_);
  }

  void BlockAnnounceObserverImpl::start() {
    transport_->subscribe(
        makeTopic(kBlockAnnounceTopic, *hasher_),
        [wp{weak_from_this()}](const TopicNotification &notification) {
          if (auto self = wp.lock()) {
            self->onMessage(notification);
          }
        });
  }

  void BlockAnnounceObserverImpl::onMessage(
      const TopicNotification &notification) {
    if (not notification.sender) {
      SL_DEBUG(log_, "Drop block announce without sender");
      return;
    }
    auto announce = ::scale::decode<BlockAnnounce>(notification.message);
    if (not announce) {
      SL_WARN(log_,
              "Malformed block announce from {}: {}",
              *notification.sender,
              announce.error());
      return;
    }
    onBlockAnnounce(*notification.sender, announce.value());
  }

  void BlockAnnounceObserverImpl::onBlockAnnounce(
      const libp2p::peer::PeerId &peer_id, const BlockAnnounce &announce) {
    const auto number = announce.header.number;
    SL_DEBUG(log_, "Block #{} announced by {}", number, peer_id);

    auto res =
        import_queue_->importBlock(consensus::BlockOrigin::kNetworkBroadcast,
                                   announce.header,
                                   std::nullopt,
                                   announce.body);
    if (not res) {
      // already logged by the import queue
      SL_DEBUG(log_,
               "Block #{} announced by {} was not imported: {}",
               number,
               peer_id,
               res.error());
    }
  }

}  // namespace singleton::network
