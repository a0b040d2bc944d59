/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include <libp2p/peer/peer_id.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/hasher.hpp"

namespace singleton::network {

  /// Gossip topics are identified by the hash of their name
  using Topic = common::Hash256;

  inline Topic makeTopic(std::string_view name, const crypto::Hasher &hasher) {
    return hasher.sha2_256(common::BufferView{
        reinterpret_cast<const uint8_t *>(name.data()), name.size()});
  }

  /**
   * Message received on a topic
   */
  struct TopicNotification {
    /// originating peer, absent for messages injected locally
    std::optional<libp2p::peer::PeerId> sender;
    common::Buffer message;
  };

  /**
   * Decides whether a received message is handed to subscribers and kept for
   * further propagation
   */
  class GossipValidator {
   public:
    enum class ValidationResult : uint8_t {
      kProcessAndKeep,
      kDiscard,
    };

    virtual ~GossipValidator() = default;

    virtual ValidationResult validate(
        const Topic &topic, const TopicNotification &notification) = 0;
  };

  /**
   * Topic based flooding of opaque payloads
   */
  class GossipTransport {
   public:
    using Handler = std::function<void(const TopicNotification &)>;

    virtual ~GossipTransport() = default;

    /**
     * Messages are delivered to subscribers only between start() and stop()
     */
    virtual void start() = 0;

    virtual void stop() = 0;

    virtual const libp2p::peer::PeerId &localPeer() const = 0;

    /**
     * Send the message to every peer subscribed to the topic
     * @param force send even if the same message was flooded already
     */
    virtual void flood(const Topic &topic,
                       common::Buffer message,
                       bool force) = 0;

    virtual void subscribe(const Topic &topic, Handler handler) = 0;

    virtual void setValidator(const Topic &topic,
                              std::shared_ptr<GossipValidator> validator) = 0;
  };

}  // namespace singleton::network
