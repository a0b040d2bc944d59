/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "authorship/proposer.hpp"

#include "clock/clock.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"

namespace singleton::authorship {

  enum class ProposerError {
    DEADLINE_EXCEEDED = 1,
    PROOF_RECORDING_NOT_SUPPORTED,
  };

  /**
   * Builds blocks which carry nothing but the inherents. The state root is
   * inherited from the parent as no state transition is executed.
   */
  class BasicProposer : public Proposer {
   public:
    BasicProposer(primitives::BlockInfo parent,
                  common::Hash256 parent_state_root,
                  std::shared_ptr<clock::SteadyClock> clock,
                  std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<Proposal> propose(
        const primitives::InherentData &inherent_data,
        const primitives::Digest &inherent_digest,
        std::chrono::milliseconds time_budget,
        bool record_proof) override;

   private:
    primitives::BlockInfo parent_;
    common::Hash256 parent_state_root_;
    std::shared_ptr<clock::SteadyClock> clock_;
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger logger_;
  };

  class BasicProposerFactory : public ProposerFactory {
   public:
    BasicProposerFactory(std::shared_ptr<clock::SteadyClock> clock,
                         std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<std::shared_ptr<Proposer>> init(
        const primitives::BlockHeader &parent_header) override;

   private:
    std::shared_ptr<clock::SteadyClock> clock_;
    std::shared_ptr<crypto::Hasher> hasher_;
  };

}  // namespace singleton::authorship

OUTCOME_HPP_DECLARE_ERROR(singleton::authorship, ProposerError);
