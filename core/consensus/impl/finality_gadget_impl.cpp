/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/finality_gadget_impl.hpp"

#include <boost/asio/post.hpp>
#include <boost/assert.hpp>

#include "consensus/constants.hpp"
#include "consensus/seal_codec.hpp"
#include "consensus/sealing.hpp"
#include "network/types/gossip_message.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::consensus, FinalityMessageError, e) {
  using E = singleton::consensus::FinalityMessageError;
  switch (e) {
    case E::WRONG_ENGINE:
      return "Finality message is tagged for another consensus engine";
    case E::UNKNOWN_PROTOCOL:
      return "Finality message has unknown protocol name";
    case E::INVALID_SIGNATURE:
      return "Finality justification is not signed by the finality authority";
  }
  return "Unknown FinalityMessageError";
}

namespace singleton::consensus {
  using primitives::events::ChainEventParams;
  using primitives::events::ChainEventSubscriber;
  using primitives::events::ChainEventType;

  FinalityGadgetImpl::FinalityGadgetImpl(
      std::shared_ptr<boost::asio::io_context> io_context,
      FinalityAuthority finality_authority,
      std::optional<crypto::Sr25519Keypair> keypair,
      std::shared_ptr<blockchain::BlockTree> block_tree,
      primitives::events::ChainSubscriptionEnginePtr chain_events_engine,
      std::shared_ptr<network::GossipTransport> transport,
      std::shared_ptr<network::GossipValidator> validator,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider,
      std::shared_ptr<crypto::Hasher> hasher)
      : io_context_{std::move(io_context)},
        finality_authority_{std::move(finality_authority)},
        keypair_{std::move(keypair)},
        block_tree_{std::move(block_tree)},
        chain_events_engine_{std::move(chain_events_engine)},
        transport_{std::move(transport)},
        validator_{std::move(validator)},
        sr25519_provider_{std::move(sr25519_provider)},
        hasher_{std::move(hasher)},
        log_{log::createLogger("FinalityGadget", "finality")} {
    BOOST_ASSERT(io_context_);
    BOOST_ASSERT(block_tree_);
    BOOST_ASSERT(chain_events_engine_);
    BOOST_ASSERT(transport_);
    BOOST_ASSERT(validator_);
    BOOST_ASSERT(sr25519_provider_);
    BOOST_ASSERT(hasher_);
    topic_ = network::makeTopic(kFinalityTopic, *hasher_);
  }

  void FinalityGadgetImpl::start() {
    if (started_.exchange(true)) {
      return;
    }

    // the transport has no unsubscribe, the handler stays through restarts
    // and is muted by started_ while the gadget is stopped
    std::call_once(transport_subscribed_, [this] {
      transport_->setValidator(topic_, validator_);
      transport_->subscribe(
          topic_,
          [wp{weak_from_this()}](
              const network::TopicNotification &notification) {
            auto self = wp.lock();
            if (not self) {
              return;
            }
            boost::asio::post(*self->io_context_, [wp, notification] {
              auto self = wp.lock();
              if (not self or not self->started_) {
                return;
              }
              if (auto res = self->onGossipMessage(notification); not res) {
                SL_DEBUG(self->log_,
                         "Finality message is dropped: {}",
                         res.error());
              }
            });
          });
    });

    if (keypair_.has_value()) {
      chain_sub_ = std::make_shared<ChainEventSubscriber>(chain_events_engine_);
      chain_sub_->subscribe(chain_sub_->generateSubscriptionSetId(),
                            ChainEventType::kBlockImported);
      chain_sub_->setCallback(
          [wp{weak_from_this()}](subscription::SubscriptionSetId,
                                 const ChainEventType &,
                                 const ChainEventParams &event) {
            if (not event.is_new_best) {
              return;
            }
            auto self = wp.lock();
            if (not self) {
              return;
            }
            boost::asio::post(*self->io_context_, [wp, block{event.block}] {
              auto self = wp.lock();
              if (not self or not self->started_) {
                return;
              }
              if (auto res = self->onNewBestBlock(block); not res) {
                SL_WARN(self->log_,
                        "Unable to attest finality of {}: {}",
                        block,
                        res.error());
              }
            });
          });
    }

    transport_->start();
    SL_INFO(log_,
            "Finality gadget started{}",
            keypair_.has_value() ? " as finality authority" : "");
  }

  void FinalityGadgetImpl::stop() {
    if (not started_.exchange(false)) {
      return;
    }
    if (chain_sub_) {
      chain_sub_->unsubscribe();
      chain_sub_.reset();
    }
    transport_->stop();
    SL_INFO(log_, "Finality gadget stopped");
  }

  outcome::result<FinalityMessage> FinalityGadgetImpl::decodeMessage(
      const network::TopicNotification &notification) const {
    OUTCOME_TRY(envelope,
                ::scale::decode<network::GossipMessage>(notification.message));
    if (envelope.engine_id != kEngineId) {
      return FinalityMessageError::WRONG_ENGINE;
    }
    if (envelope.protocol_name != kFinalityProtocolName) {
      return FinalityMessageError::UNKNOWN_PROTOCOL;
    }
    return ::scale::decode<FinalityMessage>(envelope.body);
  }

  outcome::result<void> FinalityGadgetImpl::onGossipMessage(
      const network::TopicNotification &notification) {
    OUTCOME_TRY(message, decodeMessage(notification));

    OUTCOME_TRY(valid,
                finality_authority_.verify(message.block_hash,
                                           message.justification));
    if (not valid) {
      SL_WARN(log_,
              "Invalid finality justification for {} received from {}",
              message.block_hash,
              notification.sender ? fmt::format("{}", *notification.sender)
                                  : std::string("local"));
      return FinalityMessageError::INVALID_SIGNATURE;
    }

    auto res = block_tree_->finalize(
        message.block_hash, makeJustification(message.justification), true);
    if (not res) {
      SL_WARN(log_,
              "Unable to finalize block {}: {}",
              message.block_hash,
              res.error());
      return res.as_failure();
    }
    SL_DEBUG(log_, "Applied finality of block {}", message.block_hash);
    return outcome::success();
  }

  outcome::result<void> FinalityGadgetImpl::onNewBestBlock(
      const primitives::BlockInfo &block) {
    BOOST_ASSERT(keypair_.has_value());
    OUTCOME_TRY(justification,
                signJustification(block.hash, *keypair_, *sr25519_provider_));

    FinalityMessage message{
        .block_hash = block.hash,
        .justification = justification,
    };
    OUTCOME_TRY(body, ::scale::encode(message));
    network::GossipMessage envelope{
        .engine_id = kEngineId,
        .protocol_name = std::string(kFinalityProtocolName),
        .body = common::Buffer(std::move(body)),
    };
    OUTCOME_TRY(encoded, ::scale::encode(envelope));
    transport_->flood(topic_, common::Buffer(std::move(encoded)), false);
    SL_DEBUG(log_, "Flooded finality of block {}", block);

    auto res = block_tree_->finalize(
        block.hash, makeJustification(justification), true);
    if (not res) {
      SL_WARN(log_, "Unable to finalize block {}: {}", block, res.error());
      return res.as_failure();
    }
    return outcome::success();
  }

}  // namespace singleton::consensus
