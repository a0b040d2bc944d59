/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "consensus/types/authority_id.hpp"
#include "consensus/types/finality_justification.hpp"
#include "consensus/types/seal.hpp"
#include "crypto/sr25519_provider.hpp"
#include "primitives/common.hpp"

namespace singleton::consensus {

  /**
   * Checks seals against the configured block authority
   */
  class BlockAuthority {
   public:
    BlockAuthority(BlockAuthorityId id,
                   std::shared_ptr<crypto::Sr25519Provider> sr25519_provider);

    const BlockAuthorityId &id() const {
      return id_;
    }

    /**
     * @param pre_seal_hash hash of the header with the seal removed
     * @return true if the seal was made by the block authority over the hash
     */
    outcome::result<bool> verify(const primitives::BlockHash &pre_seal_hash,
                                 const Seal &seal) const;

   private:
    BlockAuthorityId id_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
  };

  /**
   * Checks justifications against the configured finality authority
   */
  class FinalityAuthority {
   public:
    FinalityAuthority(
        FinalityAuthorityId id,
        std::shared_ptr<crypto::Sr25519Provider> sr25519_provider);

    const FinalityAuthorityId &id() const {
      return id_;
    }

    /**
     * @param block_hash post-seal hash of the attested block
     */
    outcome::result<bool> verify(
        const primitives::BlockHash &block_hash,
        const FinalityJustification &justification) const;

   private:
    FinalityAuthorityId id_;
    std::shared_ptr<crypto::Sr25519Provider> sr25519_provider_;
  };

}  // namespace singleton::consensus
