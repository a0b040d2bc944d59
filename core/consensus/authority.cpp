/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/authority.hpp"

#include <boost/assert.hpp>

namespace singleton::consensus {

  BlockAuthority::BlockAuthority(
      BlockAuthorityId id,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider)
      : id_(std::move(id)), sr25519_provider_(std::move(sr25519_provider)) {
    BOOST_ASSERT(sr25519_provider_ != nullptr);
  }

  outcome::result<bool> BlockAuthority::verify(
      const primitives::BlockHash &pre_seal_hash, const Seal &seal) const {
    return sr25519_provider_->verify(
        seal.signature, pre_seal_hash, crypto::Sr25519PublicKey{id_});
  }

  FinalityAuthority::FinalityAuthority(
      FinalityAuthorityId id,
      std::shared_ptr<crypto::Sr25519Provider> sr25519_provider)
      : id_(std::move(id)), sr25519_provider_(std::move(sr25519_provider)) {
    BOOST_ASSERT(sr25519_provider_ != nullptr);
  }

  outcome::result<bool> FinalityAuthority::verify(
      const primitives::BlockHash &block_hash,
      const FinalityJustification &justification) const {
    return sr25519_provider_->verify(
        justification.signature, block_hash, crypto::Sr25519PublicKey{id_});
  }

}  // namespace singleton::consensus
