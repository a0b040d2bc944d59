/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/block_import.hpp"

#include <memory>

#include "consensus/authority.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"

namespace singleton::consensus {

  /**
   * Block import decorator that finalizes blocks arriving with a valid
   * justification of the finality authority. Everything else is delegated
   * to the inner import.
   */
  class FinalityBlockImport : public BlockImport {
   public:
    FinalityBlockImport(std::shared_ptr<BlockImport> inner,
                        FinalityAuthority finality_authority,
                        std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<ImportResult> checkBlock(
        const BlockCheckParams &params) override;

    outcome::result<ImportResult> importBlock(
        BlockImportParams params) override;

   private:
    /// Marks the block finalized if its justification checks out
    void applyJustification(BlockImportParams &params) const;

    std::shared_ptr<BlockImport> inner_;
    FinalityAuthority finality_authority_;
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger log_;
  };

}  // namespace singleton::consensus
