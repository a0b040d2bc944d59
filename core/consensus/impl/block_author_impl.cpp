/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/block_author_impl.hpp"

#include <boost/assert.hpp>

#include "consensus/sealing.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::consensus, BlockAuthorError, e) {
  using E = singleton::consensus::BlockAuthorError;
  switch (e) {
    case E::NODE_IS_SYNCING:
      return "Authoring is skipped while the node is syncing";
  }
  return "Unknown BlockAuthorError";
}

namespace singleton::consensus {

  BlockAuthorImpl::BlockAuthorImpl(
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
      std::shared_ptr<crypto::Hasher> hasher)
      : config_{config},
        keypair_{std::move(keypair)},
        timer_{std::move(timer)},
        block_tree_{std::move(block_tree)},
        proposer_factory_{std::move(proposer_factory)},
        block_import_{std::move(block_import)},
        sync_oracle_{std::move(sync_oracle)},
        block_announce_transmitter_{std::move(block_announce_transmitter)},
        sr25519_provider_{std::move(sr25519_provider)},
        hasher_{std::move(hasher)},
        log_{log::createLogger("BlockAuthor", "block_author")} {
    BOOST_ASSERT(timer_);
    BOOST_ASSERT(block_tree_);
    BOOST_ASSERT(proposer_factory_);
    BOOST_ASSERT(block_import_);
    BOOST_ASSERT(sync_oracle_);
    BOOST_ASSERT(block_announce_transmitter_);
    BOOST_ASSERT(sr25519_provider_);
    BOOST_ASSERT(hasher_);
  }

  void BlockAuthorImpl::start() {
    if (not stopped_.exchange(false)) {
      return;
    }
    SL_INFO(log_,
            "Block authoring started with interval {} ms as {}",
            config_.interval.count(),
            keypair_.public_key);
    scheduleNextTick();
  }

  void BlockAuthorImpl::stop() {
    if (stopped_.exchange(true)) {
      return;
    }
    timer_->cancel();
    SL_INFO(log_, "Block authoring stopped");
  }

  void BlockAuthorImpl::scheduleNextTick() {
    timer_->expiresAfter(config_.interval);
    timer_->asyncWait([wp{weak_from_this()}](
                          const boost::system::error_code &ec) {
      auto self = wp.lock();
      if (not self or self->stopped_) {
        return;
      }
      if (ec) {
        SL_WARN(self->log_,
                "error happened while waiting on the timer: {}",
                ec.message());
      } else if (auto res = self->processTick(); not res) {
        SL_DEBUG(self->log_, "Tick ended without a block: {}", res.error());
      }
      self->scheduleNextTick();
    });
  }

  outcome::result<primitives::BlockInfo> BlockAuthorImpl::processTick() {
    if (sync_oracle_->isMajorSyncing()) {
      if (config_.skip_while_syncing) {
        SL_INFO(log_, "Skipping block authoring while the node is syncing");
        return BlockAuthorError::NODE_IS_SYNCING;
      }
      SL_INFO(log_, "Node is syncing, authoring a block anyway");
    }

    auto best_header_res = block_tree_->bestBlockHeader();
    if (not best_header_res) {
      SL_WARN(log_,
              "Unable to fetch the best header: {}",
              best_header_res.error());
      return best_header_res.as_failure();
    }
    const auto &best_header = best_header_res.value();

    auto proposer_res = proposer_factory_->init(best_header);
    if (not proposer_res) {
      SL_WARN(log_,
              "Unable to create proposer on top of #{}: {}",
              best_header.number,
              proposer_res.error());
      return proposer_res.as_failure();
    }
    auto proposal_res =
        proposer_res.value()->propose(primitives::InherentData{},
                                      primitives::Digest{},
                                      config_.proposal_time_budget,
                                      false);
    if (not proposal_res) {
      SL_WARN(log_,
              "Unable to propose a block on top of #{}: {}",
              best_header.number,
              proposal_res.error());
      return proposal_res.as_failure();
    }
    auto &proposal = proposal_res.value();

    auto sealed_res = signAndExtract(
        proposal.block.header, keypair_, *sr25519_provider_, *hasher_);
    if (not sealed_res) {
      SL_WARN(log_,
              "Unable to seal block #{}: {}",
              proposal.block.header.number,
              sealed_res.error());
      return sealed_res.as_failure();
    }
    auto &sealed = sealed_res.value();
    const primitives::BlockInfo block_info{proposal.block.header.number,
                                           sealed.post_hash};

    BlockImportParams params{
        .origin = BlockOrigin::kOwn,
        .header = std::move(proposal.block.header),
        .post_digests = {std::move(sealed.seal)},
        .body = proposal.block.body,
        .storage_changes = std::move(proposal.storage_changes),
        .post_hash = sealed.post_hash,
        .fork_choice = ForkChoiceStrategy::kLongestChain,
    };
    auto sealed_header = params.postHeader();

    auto import_res = block_import_->importBlock(std::move(params));
    if (not import_res) {
      SL_WARN(log_,
              "Unable to import block {}: {}",
              block_info,
              import_res.error());
      return import_res.as_failure();
    }
    if (import_res.value() != ImportResult::kImported) {
      SL_WARN(log_,
              "Block {} was not imported, result {}",
              block_info,
              static_cast<int>(import_res.value()));
      return block_info;
    }
    SL_INFO(log_, "Authored block {}", block_info);

    block_announce_transmitter_->blockAnnounce(network::BlockAnnounce{
        .header = std::move(sealed_header),
        .body = std::move(proposal.block.body),
    });
    return block_info;
  }

}  // namespace singleton::consensus
