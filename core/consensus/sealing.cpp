/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/sealing.hpp"

#include "consensus/seal_codec.hpp"

namespace singleton::consensus {

  outcome::result<SealedHeader> signAndExtract(
      const primitives::BlockHeader &unsealed_header,
      const crypto::Sr25519Keypair &keypair,
      const crypto::Sr25519Provider &sr25519_provider,
      const crypto::Hasher &hasher) {
    auto pre_seal_hash =
        primitives::calculateBlockHash(unsealed_header, hasher);

    OUTCOME_TRY(signature, sr25519_provider.sign(keypair, pre_seal_hash));

    auto seal_digest = makeSealDigest(Seal{std::move(signature)});

    auto sealed_header = unsealed_header;
    sealed_header.digest.emplace_back(seal_digest);
    auto post_hash = primitives::calculateBlockHash(sealed_header, hasher);

    return SealedHeader{post_hash, std::move(seal_digest)};
  }

  outcome::result<FinalityJustification> signJustification(
      const primitives::BlockHash &block_hash,
      const crypto::Sr25519Keypair &keypair,
      const crypto::Sr25519Provider &sr25519_provider) {
    OUTCOME_TRY(signature, sr25519_provider.sign(keypair, block_hash));
    return FinalityJustification{std::move(signature)};
  }

}  // namespace singleton::consensus
