/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "authorship/impl/basic_proposer_factory.hpp"

#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(singleton::authorship, ProposerError, e) {
  using E = singleton::authorship::ProposerError;
  switch (e) {
    case E::DEADLINE_EXCEEDED:
      return "Block was not built within the time budget";
    case E::PROOF_RECORDING_NOT_SUPPORTED:
      return "Storage proof recording is not supported";
  }
  return "Unknown ProposerError";
}

namespace singleton::authorship {

  BasicProposer::BasicProposer(primitives::BlockInfo parent,
                               common::Hash256 parent_state_root,
                               std::shared_ptr<clock::SteadyClock> clock,
                               std::shared_ptr<crypto::Hasher> hasher)
      : parent_{parent},
        parent_state_root_{parent_state_root},
        clock_{std::move(clock)},
        hasher_{std::move(hasher)},
        logger_{log::createLogger("Proposer", "authorship")} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(hasher_);
  }

  outcome::result<Proposal> BasicProposer::propose(
      const primitives::InherentData &inherent_data,
      const primitives::Digest &inherent_digest,
      std::chrono::milliseconds time_budget,
      bool record_proof) {
    if (record_proof) {
      return ProposerError::PROOF_RECORDING_NOT_SUPPORTED;
    }
    const auto deadline = clock_->now() + time_budget;

    Proposal proposal;
    auto &block = proposal.block;

    // each inherent goes into the block as an extrinsic of its own
    for (const auto &[identifier, data] : inherent_data.data) {
      OUTCOME_TRY(encoded, ::scale::encode(identifier, data));
      SL_DEBUG(logger_, "Adding inherent {}", identifier);
      block.body.push_back(
          primitives::Extrinsic{common::Buffer(std::move(encoded))});
    }

    OUTCOME_TRY(encoded_body, ::scale::encode(block.body));
    block.header.parent_hash = parent_.hash;
    block.header.number = parent_.number + 1;
    block.header.state_root = parent_state_root_;
    block.header.extrinsics_root = hasher_->sha2_256(encoded_body);
    block.header.digest = inherent_digest;

    if (clock_->now() > deadline) {
      SL_WARN(logger_,
              "Block #{} on top of {} missed the time budget of {} ms",
              block.header.number,
              parent_,
              time_budget.count());
      return ProposerError::DEADLINE_EXCEEDED;
    }

    SL_DEBUG(logger_,
             "Proposed block #{} with {} extrinsics on top of {}",
             block.header.number,
             block.body.size(),
             parent_);
    return proposal;
  }

  BasicProposerFactory::BasicProposerFactory(
      std::shared_ptr<clock::SteadyClock> clock,
      std::shared_ptr<crypto::Hasher> hasher)
      : clock_{std::move(clock)}, hasher_{std::move(hasher)} {
    BOOST_ASSERT(clock_);
    BOOST_ASSERT(hasher_);
  }

  outcome::result<std::shared_ptr<Proposer>> BasicProposerFactory::init(
      const primitives::BlockHeader &parent_header) {
    primitives::BlockInfo parent{
        parent_header.number,
        primitives::calculateBlockHash(parent_header, *hasher_)};
    return std::make_shared<BasicProposer>(
        parent, parent_header.state_root, clock_, hasher_);
  }

}  // namespace singleton::authorship
