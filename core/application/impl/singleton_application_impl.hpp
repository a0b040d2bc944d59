/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/singleton_application.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "application/app_configuration.hpp"
#include "blockchain/impl/in_memory_block_tree.hpp"
#include "clock/clock.hpp"
#include "consensus/block_author.hpp"
#include "consensus/finality_gadget.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"
#include "log/logger.hpp"
#include "network/gossip_transport.hpp"
#include "network/impl/block_announce_observer_impl.hpp"
#include "network/impl/loopback_gossip_hub.hpp"
#include "network/impl/static_sync_oracle.hpp"

namespace singleton::application {

  class SingletonApplicationImpl final : public SingletonApplication {
   public:
    explicit SingletonApplicationImpl(
        std::shared_ptr<AppConfiguration> app_config);

    ~SingletonApplicationImpl() override;

    int run() override;

    void stop() override;

   private:
    using WorkGuard = boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>;

    /// Components of one node sharing the loopback network
    struct Node {
      std::string name;
      std::shared_ptr<boost::asio::io_context> network_io;
      std::shared_ptr<boost::asio::io_context> author_io;
      std::shared_ptr<blockchain::InMemoryBlockTree> block_tree;
      std::shared_ptr<network::LoopbackGossipEndpoint> transport;
      std::shared_ptr<network::BlockAnnounceObserverImpl>
          block_announce_observer;
      std::shared_ptr<consensus::BlockAuthor> block_author;
      std::shared_ptr<consensus::FinalityGadget> finality_gadget;
      primitives::events::ChainEventSubscriberPtr finality_sub;
    };

    /// Resolves authorities and keypairs from the configuration
    bool prepareKeys();

    outcome::result<Node> makeNode(size_t index);

    /// Runs the io_context in a new thread until it is stopped
    void spawn(const std::string &name,
               std::shared_ptr<boost::asio::io_context> io_context);

    std::shared_ptr<AppConfiguration> app_config_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
    std::shared_ptr<clock::SteadyClock> clock_;
    std::shared_ptr<network::LoopbackGossipHub> hub_;
    std::shared_ptr<network::StaticSyncOracle> sync_oracle_;

    std::optional<consensus::BlockAuthorityId> block_authority_;
    std::optional<consensus::FinalityAuthorityId> finality_authority_;
    std::optional<crypto::Sr25519Keypair> block_keypair_;
    std::optional<crypto::Sr25519Keypair> finality_keypair_;

    std::shared_ptr<boost::asio::io_context> main_io_;
    std::vector<Node> nodes_;
    std::vector<WorkGuard> work_guards_;
    std::vector<std::thread> threads_;
    std::atomic_bool stopping_ = false;

    log::Logger logger_;
  };

}  // namespace singleton::application
