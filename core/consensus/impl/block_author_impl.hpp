/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/block_author.hpp"

#include <atomic>
#include <memory>

#include "authorship/proposer.hpp"
#include "blockchain/block_tree.hpp"
#include "clock/timer.hpp"
#include "consensus/block_import.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"
#include "log/logger.hpp"
#include "network/block_announce_transmitter.hpp"
#include "network/sync_oracle.hpp"

namespace singleton::consensus {

  enum class BlockAuthorError {
    NODE_IS_SYNCING = 1,
  };

  class BlockAuthorImpl final
      : public BlockAuthor,
        public std::enable_shared_from_this<BlockAuthorImpl> {
   public:
    BlockAuthorImpl(
        AuthoringConfig config,
        crypto::Sr25519Keypair keypair,
        std::shared_ptr<clock::Timer> timer,
        std::shared_ptr<blockchain::BlockTree> block_tree,
        std::shared_ptr<authorship::ProposerFactory> proposer_factory,
        std::shared_ptr<BlockImport> block_import,
        std::shared_ptr<network::SyncOracle> sync_oracle,
        std::shared_ptr<network::BlockAnnounceTransmitter>
            block_announce_transmitter,
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider,
        std::shared_ptr<crypto::Hasher> hasher);

    void start() override;

    void stop() override;

    /**
     * One authoring attempt: best header, propose, seal, import, announce.
     * Failures are logged here and returned.
     * @return the imported block
     */
    outcome::result<primitives::BlockInfo> processTick();

   private:
    void scheduleNextTick();

    const AuthoringConfig config_;
    const crypto::Sr25519Keypair keypair_;
    std::shared_ptr<clock::Timer> timer_;
    std::shared_ptr<blockchain::BlockTree> block_tree_;
    std::shared_ptr<authorship::ProposerFactory> proposer_factory_;
    std::shared_ptr<BlockImport> block_import_;
    std::shared_ptr<network::SyncOracle> sync_oracle_;
    std::shared_ptr<network::BlockAnnounceTransmitter>
        block_announce_transmitter_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
    std::shared_ptr<crypto::Hasher> hasher_;

    std::atomic_bool stopped_ = true;
    log::Logger log_;
  };

}  // namespace singleton::consensus

OUTCOME_HPP_DECLARE_ERROR(singleton::consensus, BlockAuthorError);
