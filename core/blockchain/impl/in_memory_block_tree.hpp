/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "blockchain/block_tree.hpp"

#include <mutex>
#include <unordered_map>

#include "consensus/block_import.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"
#include "primitives/events.hpp"

namespace singleton::blockchain {

  /**
   * Block tree kept in memory. Doubles as the block import the consensus
   * pipeline delegates to. Best block is the highest block descending from
   * the last finalized one, the first seen wins on equal height.
   */
  class InMemoryBlockTree : public BlockTree, public consensus::BlockImport {
   public:
    InMemoryBlockTree(
        const primitives::BlockHeader &genesis_header,
        std::shared_ptr<crypto::Hasher> hasher,
        primitives::events::ChainSubscriptionEnginePtr chain_events_engine);

    ~InMemoryBlockTree() override = default;

    const primitives::BlockHash &getGenesisBlockHash() const override;


    outcome::result<primitives::BlockHeader> getBlockHeader(
        const primitives::BlockHash &block_hash) const override;

    outcome::result<primitives::BlockBody> getBlockBody(
        const primitives::BlockHash &block_hash) const override;

    outcome::result<primitives::Justification> getBlockJustification(
        const primitives::BlockHash &block_hash) const override;

    outcome::result<void> finalize(
        const primitives::BlockHash &block_hash,
        const primitives::Justification &justification,
        bool notify) override;

    bool hasDirectChain(const primitives::BlockHash &ancestor,
                        const primitives::BlockHash &descendant) const override;

    bool isFinalized(const primitives::BlockInfo &block) const override;

    primitives::BlockInfo bestBlock() const override;

    outcome::result<primitives::BlockHeader> bestBlockHeader() const override;

    primitives::BlockInfo getLastFinalized() const override;

    outcome::result<consensus::ImportResult> checkBlock(
        const consensus::BlockCheckParams &params) override;

    outcome::result<consensus::ImportResult> importBlock(
        consensus::BlockImportParams params) override;

   private:
    struct BlockEntry {
      primitives::BlockHeader header;
      std::optional<primitives::BlockBody> body;
      std::optional<primitives::Justification> justification;
    };

    bool hasDirectChainNoLock(const primitives::BlockHash &ancestor,
                              const primitives::BlockHash &descendant) const;

    /// @return newly finalized block, nullopt if finality did not move
    std::optional<primitives::BlockInfo> finalizeNoLock(
        const primitives::BlockHash &block_hash,
        std::optional<primitives::Justification> justification);

    /// Picks the best block among descendants of the last finalized one
    void reorganizeNoLock();

    std::shared_ptr<crypto::Hasher> hasher_;
    primitives::events::ChainSubscriptionEnginePtr chain_events_engine_;

    mutable std::mutex mutex_;
    std::unordered_map<primitives::BlockHash, BlockEntry> blocks_;
    primitives::BlockHash genesis_hash_;
    primitives::BlockInfo best_block_;
    primitives::BlockInfo last_finalized_;

    log::Logger log_;
  };

}  // namespace singleton::blockchain
