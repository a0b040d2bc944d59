/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"
#include "outcome/outcome.hpp"

namespace singleton::crypto {

  enum class Sr25519ProviderError {
    SIGN_EMPTY_KEYPAIR = 1,
  };

  /**
   * Schnorr signatures over Ristretto, as used by both authorities: the block
   * authority signs pre-seal hashes, the finality authority signs block
   * hashes
   */
  class Sr25519Provider {
   public:
    virtual ~Sr25519Provider() = default;

    /// Deterministic, the same seed always gives the same keypair
    virtual Sr25519Keypair generateKeypair(const Sr25519Seed &seed) const = 0;

    /// @return SIGN_EMPTY_KEYPAIR for a default constructed keypair
    virtual outcome::result<Sr25519Signature> sign(
        const Sr25519Keypair &keypair, common::BufferView message) const = 0;

    /// @return false for a signature made by another key or over other bytes
    virtual outcome::result<bool> verify(
        const Sr25519Signature &signature,
        common::BufferView message,
        const Sr25519PublicKey &public_key) const = 0;
  };

}  // namespace singleton::crypto

OUTCOME_HPP_DECLARE_ERROR(singleton::crypto, Sr25519ProviderError)
