/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "network/impl/loopback_gossip_hub.hpp"

#include <boost/asio/post.hpp>
#include <boost/assert.hpp>
#include <libp2p/multi/multihash.hpp>

namespace singleton::network {

  LoopbackGossipEndpoint::LoopbackGossipEndpoint(
      std::weak_ptr<LoopbackGossipHub> hub,
      libp2p::peer::PeerId peer_id,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<crypto::Hasher> hasher,
      size_t flooded_capacity)
      : hub_{std::move(hub)},
        peer_id_{std::move(peer_id)},
        io_context_{std::move(io_context)},
        hasher_{std::move(hasher)},
        flooded_capacity_{flooded_capacity},
        log_{log::createLogger("LoopbackGossip", "gossip")} {
    BOOST_ASSERT(io_context_);
    BOOST_ASSERT(hasher_);
    BOOST_ASSERT(flooded_capacity_ > 0);
  }

  void LoopbackGossipEndpoint::start() {
    started_ = true;
    SL_DEBUG(log_, "Gossip endpoint {} started", peer_id_);
  }

  void LoopbackGossipEndpoint::stop() {
    started_ = false;
    SL_DEBUG(log_, "Gossip endpoint {} stopped", peer_id_);
  }

  void LoopbackGossipEndpoint::flood(const Topic &topic,
                                     common::Buffer message,
                                     bool force) {
    if (not force) {
      common::Buffer key(topic);
      key.put(message.view());
      if (not rememberFlooded(hasher_->sha2_256(key))) {
        SL_TRACE(log_, "Message on topic {} was flooded already", topic);
        return;
      }
    }
    auto hub = hub_.lock();
    if (not hub) {
      SL_WARN(log_, "Message on topic {} is lost: hub is gone", topic);
      return;
    }
    SL_TRACE(log_,
             "Flood {} bytes on topic {} from {}",
             message.size(),
             topic,
             peer_id_);
    hub->broadcast(peer_id_, topic, message);
  }

  bool LoopbackGossipEndpoint::rememberFlooded(const common::Hash256 &key) {
    std::lock_guard lock{mutex_};
    if (not flooded_.emplace(key).second) {
      return false;
    }
    flooded_order_.emplace_back(key);
    if (flooded_order_.size() > flooded_capacity_) {
      flooded_.erase(flooded_order_.front());
      flooded_order_.pop_front();
    }
    return true;
  }

  void LoopbackGossipEndpoint::subscribe(const Topic &topic, Handler handler) {
    std::lock_guard lock{mutex_};
    handlers_[topic].emplace_back(std::move(handler));
  }

  void LoopbackGossipEndpoint::setValidator(
      const Topic &topic, std::shared_ptr<GossipValidator> validator) {
    std::lock_guard lock{mutex_};
    validators_[topic] = std::move(validator);
  }

  void LoopbackGossipEndpoint::deliver(const Topic &topic,
                                       TopicNotification notification) {
    boost::asio::post(*io_context_,
                      [wp{weak_from_this()},
                       topic,
                       notification{std::move(notification)}] {
                        if (auto self = wp.lock()) {
                          self->onMessage(topic, notification);
                        }
                      });
  }

  void LoopbackGossipEndpoint::onMessage(
      const Topic &topic, const TopicNotification &notification) {
    if (not started_) {
      return;
    }
    std::shared_ptr<GossipValidator> validator;
    std::vector<Handler> handlers;
    {
      std::lock_guard lock{mutex_};
      if (auto it = validators_.find(topic); it != validators_.end()) {
        validator = it->second;
      }
      if (auto it = handlers_.find(topic); it != handlers_.end()) {
        handlers = it->second;
      }
    }
    if (validator
        and validator->validate(topic, notification)
                == GossipValidator::ValidationResult::kDiscard) {
      SL_DEBUG(log_, "Message on topic {} discarded by validator", topic);
      return;
    }
    for (const auto &handler : handlers) {
      handler(notification);
    }
  }

  LoopbackGossipHub::LoopbackGossipHub(size_t flooded_capacity)
      : flooded_capacity_{flooded_capacity} {}

  outcome::result<std::shared_ptr<LoopbackGossipEndpoint>>
  LoopbackGossipHub::makeEndpoint(
      std::string_view name,
      std::shared_ptr<boost::asio::io_context> io_context,
      std::shared_ptr<crypto::Hasher> hasher) {
    auto digest = makeTopic(name, *hasher);
    OUTCOME_TRY(multihash,
                libp2p::multi::Multihash::create(
                    libp2p::multi::HashType::sha256, digest));
    OUTCOME_TRY(peer_id, libp2p::peer::PeerId::fromHash(multihash));

    auto endpoint = std::make_shared<LoopbackGossipEndpoint>(
        weak_from_this(),
        std::move(peer_id),
        std::move(io_context),
        std::move(hasher),
        flooded_capacity_);
    std::lock_guard lock{mutex_};
    endpoints_.emplace_back(endpoint);
    return endpoint;
  }

  void LoopbackGossipHub::broadcast(const libp2p::peer::PeerId &from,
                                    const Topic &topic,
                                    const common::Buffer &message) {
    std::vector<std::shared_ptr<LoopbackGossipEndpoint>> receivers;
    {
      std::lock_guard lock{mutex_};
      std::erase_if(endpoints_, [](const auto &wp) { return wp.expired(); });
      for (const auto &wp : endpoints_) {
        auto endpoint = wp.lock();
        if (endpoint and endpoint->localPeer() != from) {
          receivers.emplace_back(std::move(endpoint));
        }
      }
    }
    for (const auto &receiver : receivers) {
      receiver->deliver(topic, TopicNotification{from, message});
    }
  }

}  // namespace singleton::network
