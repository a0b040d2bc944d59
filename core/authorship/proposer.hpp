/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>

#include "outcome/outcome.hpp"
#include "primitives/block.hpp"
#include "primitives/digest.hpp"
#include "primitives/inherent_data.hpp"
#include "primitives/storage_changes.hpp"

namespace singleton::authorship {

  /**
   * Candidate block together with the state writes it produces
   */
  struct Proposal {
    /// block with an unsealed header
    primitives::Block block;
    primitives::StorageChanges storage_changes{};
  };

  /**
   * Create block to further proposal for consensus
   */
  class Proposer {
   public:
    virtual ~Proposer() = default;

    /**
     * Creates block on top of the parent the proposer was made for
     * @param inherent_data additional data on block from unsigned extrinsics
     * @param inherent_digest - chain-specific block auxiliary data
     * @param time_budget - how long building the block may take
     * @param record_proof - whether a storage proof has to be recorded
     * @return proposed block or error
     */
    virtual outcome::result<Proposal> propose(
        const primitives::InherentData &inherent_data,
        const primitives::Digest &inherent_digest,
        std::chrono::milliseconds time_budget,
        bool record_proof) = 0;
  };

  /**
   * Makes proposers bound to a parent block
   */
  class ProposerFactory {
   public:
    virtual ~ProposerFactory() = default;

    /**
     * @param parent_header sealed header of the block to build on
     */
    virtual outcome::result<std::shared_ptr<Proposer>> init(
        const primitives::BlockHeader &parent_header) = 0;
  };

}  // namespace singleton::authorship
