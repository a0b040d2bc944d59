/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/types/finality_justification.hpp"
#include "crypto/hasher.hpp"
#include "crypto/sr25519_provider.hpp"
#include "primitives/block_header.hpp"

namespace singleton::consensus {

  /// Result of sealing an unsealed header
  struct SealedHeader {
    /// hash of the header with the seal appended, the block identity
    primitives::BlockHash post_hash;
    /// seal digest to be attached as a post-digest
    primitives::Seal seal;
  };

  /**
   * Signs the hash of the unsealed header, appends the seal digest, hashes
   * the sealed form and detaches the seal again. The input header is not
   * modified.
   */
  outcome::result<SealedHeader> signAndExtract(
      const primitives::BlockHeader &unsealed_header,
      const crypto::Sr25519Keypair &keypair,
      const crypto::Sr25519Provider &sr25519_provider,
      const crypto::Hasher &hasher);

  /// Finality attestation over the post-seal hash of a block
  outcome::result<FinalityJustification> signJustification(
      const primitives::BlockHash &block_hash,
      const crypto::Sr25519Keypair &keypair,
      const crypto::Sr25519Provider &sr25519_provider);

}  // namespace singleton::consensus
