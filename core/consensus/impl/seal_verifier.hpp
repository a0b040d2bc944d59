/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/verifier.hpp"

#include <memory>

#include "consensus/authority.hpp"
#include "crypto/hasher.hpp"
#include "log/logger.hpp"

namespace singleton::consensus {

  /**
   * Accepts headers sealed by the block authority
   */
  class SealVerifier : public Verifier {
   public:
    SealVerifier(BlockAuthority block_authority,
                 std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<BlockImportParams> verify(
        BlockOrigin origin,
        primitives::BlockHeader header,
        std::optional<primitives::Justification> justification,
        std::optional<primitives::BlockBody> body) override;

    /**
     * Pops the seal off the header and checks it.
     * On failure the header is left as it was.
     * @return the seal digest that was removed
     */
    outcome::result<primitives::Seal> checkHeader(
        primitives::BlockHeader &header) const;

   private:
    BlockAuthority block_authority_;
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger log_;
  };

}  // namespace singleton::consensus
