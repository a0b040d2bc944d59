/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/impl/block_announce_transmitter_impl.hpp"

#include <boost/assert.hpp>

namespace singleton::network {

  BlockAnnounceTransmitterImpl::BlockAnnounceTransmitterImpl(
      std::shared_ptr<GossipTransport> transport,
      std::shared_ptr<crypto::Hasher> hasher)
      : transport_(std::move(transport)),
        hasher_(std::move(hasher)),
        log_{log::createLogger("BlockAnnounceTransmitter", "block_announce")} {
    BOOST_ASSERT(transport_);
    BOOST_ASSERT(hasher_);
    topic_ = makeTopic(kBlockAnnounceTopic, *hasher_);
  }

  void BlockAnnounceTransmitterImpl::blockAnnounce(BlockAnnounce &&announce) {
    auto encoded = ::scale::encode(announce);
    if (not encoded) {
      SL_WARN(log_,
              "Can't encode announce of block #{}: {}",
              announce.header.number,
              encoded.error());
      return;
    }
    SL_DEBUG(log_,
             "Announce block #{} {}",
             announce.header.number,
             primitives::calculateBlockHash(announce.header, *hasher_));
    transport_->flood(
        topic_, common::Buffer(std::move(encoded.value())), false);
  }

}  // namespace singleton::network
