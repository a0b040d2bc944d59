/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/gossip_transport.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace singleton::network {

  class LoopbackGossipHub;

  /**
   * Gossip endpoint of one node attached to an in-process hub. Received
   * messages are handled on the io_context of the endpoint.
   */
  class LoopbackGossipEndpoint final
      : public GossipTransport,
        public std::enable_shared_from_this<LoopbackGossipEndpoint> {
   public:
    /**
     * @param flooded_capacity how many recently flooded messages are
     * remembered to drop their repetitions
     */
    LoopbackGossipEndpoint(std::weak_ptr<LoopbackGossipHub> hub,
                           libp2p::peer::PeerId peer_id,
                           std::shared_ptr<boost::asio::io_context> io_context,
                           std::shared_ptr<crypto::Hasher> hasher,
                           size_t flooded_capacity);

    void start() override;

    void stop() override;

    const libp2p::peer::PeerId &localPeer() const override {
      return peer_id_;
    }

    void flood(const Topic &topic,
               common::Buffer message,
               bool force) override;

    void subscribe(const Topic &topic, Handler handler) override;

    void setValidator(const Topic &topic,
                      std::shared_ptr<GossipValidator> validator) override;

    /// Called by the hub for messages flooded by other endpoints
    void deliver(const Topic &topic, TopicNotification notification);

   private:
    void onMessage(const Topic &topic, const TopicNotification &notification);

    /// @return false if the message is among the recently flooded ones
    bool rememberFlooded(const common::Hash256 &key);

    std::weak_ptr<LoopbackGossipHub> hub_;
    libp2p::peer::PeerId peer_id_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::shared_ptr<crypto::Hasher> hasher_;
    const size_t flooded_capacity_;
    std::atomic_bool started_ = false;

    std::mutex mutex_;
    std::map<Topic, std::vector<Handler>> handlers_;
    std::map<Topic, std::shared_ptr<GossipValidator>> validators_;
    /// hashes of topic and payload of recently flooded messages, the oldest
    /// is forgotten once there are flooded_capacity_ of them
    std::unordered_set<common::Hash256> flooded_;
    std::deque<common::Hash256> flooded_order_;

    log::Logger log_;
  };

  /**
   * In-process stand-in for a peer-to-peer network: every message flooded by
   * one endpoint reaches all the other endpoints
   */
  class LoopbackGossipHub
      : public std::enable_shared_from_this<LoopbackGossipHub> {
   public:
    static constexpr size_t kDefaultFloodedCapacity = 8192;

    explicit LoopbackGossipHub(
        size_t flooded_capacity = kDefaultFloodedCapacity);

    /**
     * @param name is hashed into the peer id of the endpoint
     */
    outcome::result<std::shared_ptr<LoopbackGossipEndpoint>> makeEndpoint(
        std::string_view name,
        std::shared_ptr<boost::asio::io_context> io_context,
        std::shared_ptr<crypto::Hasher> hasher);

    void broadcast(const libp2p::peer::PeerId &from,
                   const Topic &topic,
                   const common::Buffer &message);

   private:
    const size_t flooded_capacity_;
    std::mutex mutex_;
    std::vector<std::weak_ptr<LoopbackGossipEndpoint>> endpoints_;
  };

}  // namespace singleton::network
