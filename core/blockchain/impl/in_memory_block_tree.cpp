/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/impl/in_memory_block_tree.hpp"

#include <boost/assert.hpp>

#include "blockchain/block_tree_error.hpp"

namespace singleton::blockchain {
  using primitives::events::ChainEventParams;
  using primitives::events::ChainEventType;

  InMemoryBlockTree::InMemoryBlockTree(
      const primitives::BlockHeader &genesis_header,
      std::shared_ptr<crypto::Hasher> hasher,
      primitives::events::ChainSubscriptionEnginePtr chain_events_engine)
      : hasher_(std::move(hasher)),
        chain_events_engine_(std::move(chain_events_engine)),
        log_(log::createLogger("BlockTree", "block_tree")) {
    BOOST_ASSERT(hasher_ != nullptr);
    BOOST_ASSERT(chain_events_engine_ != nullptr);

    genesis_hash_ = primitives::calculateBlockHash(genesis_header, *hasher_);
    blocks_.emplace(genesis_hash_,
                    BlockEntry{genesis_header, primitives::BlockBody{}, {}});
    best_block_ = {genesis_header.number, genesis_hash_};
    last_finalized_ = best_block_;
    SL_DEBUG(log_, "Block tree initialized with genesis {}", best_block_);
  }

  const primitives::BlockHash &InMemoryBlockTree::getGenesisBlockHash() const {
    return genesis_hash_;
  }

  outcome::result<primitives::BlockHeader> InMemoryBlockTree::getBlockHeader(
      const primitives::BlockHash &block_hash) const {
    std::lock_guard lock(mutex_);
    auto it = blocks_.find(block_hash);
    if (it == blocks_.end()) {
      return BlockTreeError::HEADER_NOT_FOUND;
    }
    return it->second.header;
  }

  outcome::result<primitives::BlockBody> InMemoryBlockTree::getBlockBody(
      const primitives::BlockHash &block_hash) const {
    std::lock_guard lock(mutex_);
    auto it = blocks_.find(block_hash);
    if (it == blocks_.end() or not it->second.body.has_value()) {
      return BlockTreeError::BODY_NOT_FOUND;
    }
    return it->second.body.value();
  }

  outcome::result<primitives::Justification>
  InMemoryBlockTree::getBlockJustification(
      const primitives::BlockHash &block_hash) const {
    std::lock_guard lock(mutex_);
    auto it = blocks_.find(block_hash);
    if (it == blocks_.end() or not it->second.justification.has_value()) {
      return BlockTreeError::JUSTIFICATION_NOT_FOUND;
    }
    return it->second.justification.value();
  }

  outcome::result<void> InMemoryBlockTree::finalize(
      const primitives::BlockHash &block_hash,
      const primitives::Justification &justification,
      bool notify) {
    std::optional<primitives::BlockInfo> finalized;
    {
      std::lock_guard lock(mutex_);
      if (not blocks_.contains(block_hash)) {
        return BlockTreeError::HEADER_NOT_FOUND;
      }
      finalized = finalizeNoLock(block_hash, justification);
    }

    if (finalized.has_value() and notify) {
      chain_events_engine_->notify(ChainEventType::kFinalized,
                                   ChainEventParams{finalized.value(), false});
    }
    return outcome::success();
  }

  bool InMemoryBlockTree::hasDirectChain(
      const primitives::BlockHash &ancestor,
      const primitives::BlockHash &descendant) const {
    std::lock_guard lock(mutex_);
    return hasDirectChainNoLock(ancestor, descendant);
  }

  bool InMemoryBlockTree::isFinalized(
      const primitives::BlockInfo &block) const {
    std::lock_guard lock(mutex_);
    return block.number <= last_finalized_.number
       and hasDirectChainNoLock(block.hash, last_finalized_.hash);
  }

  primitives::BlockInfo InMemoryBlockTree::bestBlock() const {
    std::lock_guard lock(mutex_);
    return best_block_;
  }

  outcome::result<primitives::BlockHeader> InMemoryBlockTree::bestBlockHeader()
      const {
    std::lock_guard lock(mutex_);
    auto it = blocks_.find(best_block_.hash);
    BOOST_ASSERT_MSG(it != blocks_.end(), "The best block is always known");
    return it->second.header;
  }

  primitives::BlockInfo InMemoryBlockTree::getLastFinalized() const {
    std::lock_guard lock(mutex_);
    return last_finalized_;
  }

  outcome::result<consensus::ImportResult> InMemoryBlockTree::checkBlock(
      const consensus::BlockCheckParams &params) {
    std::lock_guard lock(mutex_);
    if (blocks_.contains(params.hash)) {
      return consensus::ImportResult::kAlreadyInChain;
    }
    if (not blocks_.contains(params.parent_hash)) {
      return consensus::ImportResult::kUnknownParent;
    }
    return consensus::ImportResult::kImported;
  }

  outcome::result<consensus::ImportResult> InMemoryBlockTree::importBlock(
      consensus::BlockImportParams params) {
    // blocks are stored in the sealed form
    auto header = params.postHeader();
    auto block_hash = params.post_hash.has_value()
                        ? params.post_hash.value()
                        : primitives::calculateBlockHash(header, *hasher_);
    primitives::BlockInfo block_info(header.number, block_hash);

    bool is_new_best = false;
    std::optional<primitives::BlockInfo> finalized;
    {
      std::lock_guard lock(mutex_);
      if (blocks_.contains(block_hash)) {
        SL_TRACE(log_, "Block {} is already in chain", block_info);
        return consensus::ImportResult::kAlreadyInChain;
      }
      auto parent_it = blocks_.find(header.parent_hash);
      if (parent_it == blocks_.end()) {
        SL_DEBUG(log_, "Parent of block {} is unknown", block_info);
        return consensus::ImportResult::kUnknownParent;
      }
      if (parent_it->second.header.number + 1 != header.number) {
        return BlockTreeError::WRONG_BLOCK_NUMBER;
      }

      blocks_.emplace(
          block_hash,
          BlockEntry{std::move(header), std::move(params.body), {}});

      if (block_info.number > best_block_.number
          and hasDirectChainNoLock(last_finalized_.hash, block_hash)) {
        best_block_ = block_info;
        is_new_best = true;
      }

      if (params.finalized) {
        finalized = finalizeNoLock(block_hash, std::move(params.justification));
      }
    }

    SL_DEBUG(log_,
             "Imported block {}{}",
             block_info,
             is_new_best ? " (new best)" : "");

    chain_events_engine_->notify(ChainEventType::kBlockImported,
                                 ChainEventParams{block_info, is_new_best});
    if (finalized.has_value()) {
      chain_events_engine_->notify(ChainEventType::kFinalized,
                                   ChainEventParams{finalized.value(), false});
    }
    return consensus::ImportResult::kImported;
  }

  bool InMemoryBlockTree::hasDirectChainNoLock(
      const primitives::BlockHash &ancestor,
      const primitives::BlockHash &descendant) const {
    auto ancestor_it = blocks_.find(ancestor);
    if (ancestor_it == blocks_.end()) {
      return false;
    }
    auto ancestor_number = ancestor_it->second.header.number;

    auto current = descendant;
    while (true) {
      auto it = blocks_.find(current);
      if (it == blocks_.end()) {
        return false;
      }
      const auto &header = it->second.header;
      if (header.number <= ancestor_number) {
        return current == ancestor;
      }
      current = header.parent_hash;
    }
  }

  std::optional<primitives::BlockInfo> InMemoryBlockTree::finalizeNoLock(
      const primitives::BlockHash &block_hash,
      std::optional<primitives::Justification> justification) {
    auto &entry = blocks_.at(block_hash);
    primitives::BlockInfo block(entry.header.number, block_hash);

    if (block_hash == last_finalized_.hash) {
      SL_TRACE(log_, "Block {} is already finalized", block);
      return std::nullopt;
    }
    if (block.number <= last_finalized_.number) {
      SL_DEBUG(log_,
               "Block {} is not above the last finalized {}, nothing to do",
               block,
               last_finalized_);
      return std::nullopt;
    }
    if (not hasDirectChainNoLock(last_finalized_.hash, block_hash)) {
      SL_WARN(log_,
              "Block {} does not descend from the last finalized {}, "
              "finality is not changed",
              block,
              last_finalized_);
      return std::nullopt;
    }

    entry.justification = std::move(justification);
    last_finalized_ = block;

    if (not hasDirectChainNoLock(block_hash, best_block_.hash)) {
      reorganizeNoLock();
    }

    SL_INFO(log_, "Finalized block {}", block);
    return block;
  }

  void InMemoryBlockTree::reorganizeNoLock() {
    best_block_ = last_finalized_;
    for (const auto &[hash, entry] : blocks_) {
      if (entry.header.number > best_block_.number
          and hasDirectChainNoLock(last_finalized_.hash, hash)) {
        best_block_ = {entry.header.number, hash};
      }
    }
    SL_DEBUG(log_, "Best block is {} after reorganization", best_block_);
  }

}  // namespace singleton::blockchain
