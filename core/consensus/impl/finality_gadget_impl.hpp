/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/finality_gadget.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>

#include <boost/asio/io_context.hpp>

#include "blockchain/block_tree.hpp"
#include "consensus/authority.hpp"
#include "consensus/types/finality_message.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "network/gossip_transport.hpp"
#include "primitives/events.hpp"

namespace singleton::consensus {

  enum class FinalityMessageError {
    WRONG_ENGINE = 1,
    UNKNOWN_PROTOCOL,
    INVALID_SIGNATURE,
  };

  /**
   * Producer, consumer and transport driver of finality gossip. All three
   * run on the given io_context, so they never interleave.
   */
  class FinalityGadgetImpl final
      : public FinalityGadget,
        public std::enable_shared_from_this<FinalityGadgetImpl> {
   public:
    /**
     * @param keypair finality authority keypair, attestations are produced
     * only if it is given
     */
    FinalityGadgetImpl(
        std::shared_ptr<boost::asio::io_context> io_context,
        FinalityAuthority finality_authority,
        std::optional<crypto::Sr25519Keypair> keypair,
        std::shared_ptr<blockchain::BlockTree> block_tree,
        primitives::events::ChainSubscriptionEnginePtr chain_events_engine,
        std::shared_ptr<network::GossipTransport> transport,
        std::shared_ptr<network::GossipValidator> validator,
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider,
        std::shared_ptr<crypto::Hasher> hasher);

    void start() override;

    void stop() override;

    /**
     * Verifies the attestation carried by the message and finalizes the block
     */
    outcome::result<void> onGossipMessage(
        const network::TopicNotification &notification);

    /**
     * Attests the block, floods the attestation and finalizes the block
     * locally
     */
    outcome::result<void> onNewBestBlock(const primitives::BlockInfo &block);

    const network::Topic &topic() const {
      return topic_;
    }

   private:
    outcome::result<FinalityMessage> decodeMessage(
        const network::TopicNotification &notification) const;

    std::shared_ptr<boost::asio::io_context> io_context_;
    FinalityAuthority finality_authority_;
    std::optional<crypto::Sr25519Keypair> keypair_;
    std::shared_ptr<blockchain::BlockTree> block_tree_;
    primitives::events::ChainSubscriptionEnginePtr chain_events_engine_;
    std::shared_ptr<network::GossipTransport> transport_;
    std::shared_ptr<network::GossipValidator> validator_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
    std::shared_ptr<crypto::Hasher> hasher_;

    network::Topic topic_;
    primitives::events::ChainEventSubscriberPtr chain_sub_;
    std::atomic_bool started_ = false;
    std::once_flag transport_subscribed_;

    log::Logger log_;
  };

}  // namespace singleton::consensus

OUTCOME_HPP_DECLARE_ERROR(singleton::consensus, FinalityMessageError);
