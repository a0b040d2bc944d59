/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/singleton_application_impl.hpp"

#include <csignal>
#include <cstdlib>

#include <boost/asio/signal_set.hpp>
#include <boost/assert.hpp>
#include <soralog/util.hpp>

#include "authorship/impl/basic_proposer_factory.hpp"
#include "clock/impl/basic_waitable_timer.hpp"
#include "clock/impl/clock_impl.hpp"
#include "consensus/impl/block_author_impl.hpp"
#include "consensus/impl/finality_block_import.hpp"
#include "consensus/impl/finality_gadget_impl.hpp"
#include "consensus/impl/import_queue_impl.hpp"
#include "consensus/impl/seal_verifier.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/sr25519/sr25519_provider_impl.hpp"
#include "network/impl/accept_all_validator.hpp"
#include "network/impl/block_announce_transmitter_impl.hpp"

namespace singleton::application {
  using primitives::events::ChainEventParams;
  using primitives::events::ChainEventSubscriber;
  using primitives::events::ChainEventType;

  SingletonApplicationImpl::SingletonApplicationImpl(
      std::shared_ptr<AppConfiguration> app_config)
      : app_config_{std::move(app_config)},
        hasher_{std::make_shared<crypto::HasherImpl>()},
        sr25519_provider_{std::make_shared<crypto::Sr25519ProviderImpl>()},
        clock_{std::make_shared<clock::SteadyClockImpl>()},
        hub_{std::make_shared<network::LoopbackGossipHub>()},
        sync_oracle_{std::make_shared<network::StaticSyncOracle>()},
        main_io_{std::make_shared<boost::asio::io_context>()},
        logger_{log::createLogger("Application", "application")} {
    BOOST_ASSERT(app_config_);
  }

  SingletonApplicationImpl::~SingletonApplicationImpl() {
    stop();
    for (auto &thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
  }

  bool SingletonApplicationImpl::prepareKeys() {
    if (const auto &seed = app_config_->blockAuthoritySeed()) {
      block_keypair_ = sr25519_provider_->generateKeypair(*seed);
    }
    if (const auto &seed = app_config_->finalityAuthoritySeed()) {
      finality_keypair_ = sr25519_provider_->generateKeypair(*seed);
    }

    block_authority_ = app_config_->blockAuthority();
    if (block_keypair_) {
      consensus::BlockAuthorityId derived{block_keypair_->public_key};
      if (block_authority_ and *block_authority_ != derived) {
        SL_CRITICAL(logger_,
                    "Block authority seed does not match the public key {}",
                    *block_authority_);
        return false;
      }
      block_authority_ = derived;
    }

    finality_authority_ = app_config_->finalityAuthority();
    if (finality_keypair_) {
      consensus::FinalityAuthorityId derived{finality_keypair_->public_key};
      if (finality_authority_ and *finality_authority_ != derived) {
        SL_CRITICAL(logger_,
                    "Finality authority seed does not match the public key {}",
                    *finality_authority_);
        return false;
      }
      finality_authority_ = derived;
    }

    if (not block_authority_ or not finality_authority_) {
      SL_CRITICAL(logger_, "Authorities are not configured");
      return false;
    }
    SL_INFO(logger_, "Block authority is {}", *block_authority_);
    SL_INFO(logger_, "Finality authority is {}", *finality_authority_);
    return true;
  }

  outcome::result<SingletonApplicationImpl::Node>
  SingletonApplicationImpl::makeNode(size_t index) {
    Node node;
    node.name = fmt::format("node-{}", index);
    node.network_io = std::make_shared<boost::asio::io_context>();
    node.author_io = std::make_shared<boost::asio::io_context>();

    auto chain_events_engine =
        std::make_shared<primitives::events::ChainSubscriptionEngine>();
    // every node starts from the same empty genesis
    node.block_tree = std::make_shared<blockchain::InMemoryBlockTree>(
        primitives::BlockHeader{}, hasher_, chain_events_engine);

    OUTCOME_TRY(transport,
                hub_->makeEndpoint(node.name, node.network_io, hasher_));
    node.transport = transport;

    auto block_import = std::make_shared<consensus::FinalityBlockImport>(
        node.block_tree,
        consensus::FinalityAuthority{*finality_authority_, sr25519_provider_},
        hasher_);
    auto verifier = std::make_shared<consensus::SealVerifier>(
        consensus::BlockAuthority{*block_authority_, sr25519_provider_},
        hasher_);
    auto import_queue =
        std::make_shared<consensus::ImportQueueImpl>(verifier, block_import);

    node.block_announce_observer =
        std::make_shared<network::BlockAnnounceObserverImpl>(
            transport, import_queue, hasher_);

    // the first node holds the keys
    const bool holds_keys = index == 0;

    if (holds_keys and block_keypair_) {
      node.block_author = std::make_shared<consensus::BlockAuthorImpl>(
          app_config_->authoringConfig(),
          *block_keypair_,
          std::make_shared<clock::BasicWaitableTimer>(node.author_io),
          node.block_tree,
          std::make_shared<authorship::BasicProposerFactory>(clock_, hasher_),
          block_import,
          sync_oracle_,
          std::make_shared<network::BlockAnnounceTransmitterImpl>(transport,
                                                                  hasher_),
          sr25519_provider_,
          hasher_);
    }

    if (app_config_->finalityGadget()) {
      std::optional<crypto::Sr25519Keypair> keypair;
      if (holds_keys and app_config_->finalityGadgetValidator()) {
        keypair = finality_keypair_;
      }
      node.finality_gadget = std::make_shared<consensus::FinalityGadgetImpl>(
          node.network_io,
          consensus::FinalityAuthority{*finality_authority_, sr25519_provider_},
          std::move(keypair),
          node.block_tree,
          chain_events_engine,
          transport,
          std::make_shared<network::AcceptAllValidator>(),
          sr25519_provider_,
          hasher_);
    }

    node.finality_sub =
        std::make_shared<ChainEventSubscriber>(chain_events_engine);
    node.finality_sub->subscribe(node.finality_sub->generateSubscriptionSetId(),
                                 ChainEventType::kFinalized);
    node.finality_sub->setCallback(
        [log{logger_}, name{node.name}](subscription::SubscriptionSetId,
                                        const ChainEventType &,
                                        const ChainEventParams &event) {
          SL_INFO(log, "{} finalized block {}", name, event.block);
        });

    return node;
  }

  void SingletonApplicationImpl::spawn(
      const std::string &name,
      std::shared_ptr<boost::asio::io_context> io_context) {
    work_guards_.emplace_back(boost::asio::make_work_guard(*io_context));
    threads_.emplace_back([name, io_context{std::move(io_context)}] {
      soralog::util::setThreadName(name);
      io_context->run();
    });
  }

  int SingletonApplicationImpl::run() {
    if (not prepareKeys()) {
      return EXIT_FAILURE;
    }

    for (size_t i = 0; i < app_config_->nodesCount(); ++i) {
      auto node_res = makeNode(i);
      if (not node_res) {
        SL_CRITICAL(
            logger_, "Unable to set up node {}: {}", i, node_res.error());
        return EXIT_FAILURE;
      }
      nodes_.emplace_back(std::move(node_res.value()));
    }

    for (auto &node : nodes_) {
      spawn(node.name, node.network_io);
      node.block_announce_observer->start();
      node.transport->start();
      if (node.finality_gadget) {
        node.finality_gadget->start();
      }
      if (node.block_author) {
        spawn(node.name + "-author", node.author_io);
        node.block_author->start();
      }
    }
    SL_INFO(logger_, "Started {} node(s)", nodes_.size());

    boost::asio::signal_set signals{*main_io_, SIGINT, SIGTERM};
    signals.async_wait(
        [this](const boost::system::error_code &ec, int signal_number) {
          if (ec) {
            return;
          }
          SL_INFO(logger_, "Signal {} received, stopping", signal_number);
          stop();
        });

    auto work_guard = boost::asio::make_work_guard(*main_io_);
    main_io_->run();

    for (auto &thread : threads_) {
      if (thread.joinable()) {
        thread.join();
      }
    }
    threads_.clear();
    return EXIT_SUCCESS;
  }

  void SingletonApplicationImpl::stop() {
    if (stopping_.exchange(true)) {
      return;
    }
    for (auto &node : nodes_) {
      if (node.block_author) {
        node.block_author->stop();
      }
      if (node.finality_gadget) {
        node.finality_gadget->stop();
      }
      node.transport->stop();
    }
    work_guards_.clear();
    for (auto &node : nodes_) {
      node.author_io->stop();
      node.network_io->stop();
    }
    main_io_->stop();
  }

}  // namespace singleton::application
