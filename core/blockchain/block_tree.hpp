/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"
#include "primitives/block.hpp"
#include "primitives/common.hpp"
#include "primitives/justification.hpp"

namespace singleton::blockchain {

  /**
   * Read and finalize side of the chain: a tree of blocks rooted at genesis
   * with a best block (tip of the longest chain) and a last finalized block.
   * Blocks get in through BlockImport. Safe to use from several threads.
   */
  class BlockTree {
   public:
    virtual ~BlockTree() = default;

    virtual const primitives::BlockHash &getGenesisBlockHash() const = 0;

    /// Header as it was imported, i.e. still carrying its seal
    virtual outcome::result<primitives::BlockHeader> getBlockHeader(
        const primitives::BlockHash &block_hash) const = 0;

    virtual outcome::result<primitives::BlockBody> getBlockBody(
        const primitives::BlockHash &block_hash) const = 0;

    /// @return JUSTIFICATION_NOT_FOUND unless the block was finalized
    /// explicitly, ancestors finalized along with it have none
    virtual outcome::result<primitives::Justification> getBlockJustification(
        const primitives::BlockHash &block_hash) const = 0;

    /**
     * Finalizes the block together with its unfinalized ancestors and keeps
     * the justification with it. A block at or behind the last finalized one,
     * or off its chain, is left as is and that is not an error.
     * @param notify emit kFinalized to chain subscribers
     * @return HEADER_NOT_FOUND for an unknown block
     */
    virtual outcome::result<void> finalize(
        const primitives::BlockHash &block_hash,
        const primitives::Justification &justification,
        bool notify) = 0;

    /// Whether `descendant` is reached from `ancestor` by following children,
    /// a block is its own ancestor
    virtual bool hasDirectChain(
        const primitives::BlockHash &ancestor,
        const primitives::BlockHash &descendant) const = 0;

    virtual bool isFinalized(const primitives::BlockInfo &block) const = 0;

    virtual primitives::BlockInfo bestBlock() const = 0;

    virtual outcome::result<primitives::BlockHeader> bestBlockHeader()
        const = 0;

    virtual primitives::BlockInfo getLastFinalized() const = 0;
  };

}  // namespace singleton::blockchain
