/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/seal_verifier.hpp"

#include <boost/assert.hpp>

#include "consensus/constants.hpp"
#include "consensus/seal_codec.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::consensus, VerificationError, e) {
  using E = singleton::consensus::VerificationError;
  switch (e) {
    case E::UNSEALED_HEADER:
      return "Unsealed header";
    case E::WRONG_ENGINE_SEAL:
      return "Header seal for wrong engine";
    case E::INVALID_SEAL_ENCODING:
      return "Header with invalid seal";
    case E::INVALID_SEAL_SIGNATURE:
      return "Invalid seal signature";
  }
  return "Unknown VerificationError";
}

namespace singleton::consensus {

  SealVerifier::SealVerifier(BlockAuthority block_authority,
                             std::shared_ptr<crypto::Hasher> hasher)
      : block_authority_(std::move(block_authority)),
        hasher_(std::move(hasher)),
        log_(log::createLogger("SealVerifier", "verifier")) {
    BOOST_ASSERT(hasher_ != nullptr);
  }

  outcome::result<primitives::Seal> SealVerifier::checkHeader(
      primitives::BlockHeader &header) const {
    if (header.digest.empty()) {
      return VerificationError::UNSEALED_HEADER;
    }

    // last digest of the block must be a seal of this engine
    const auto *seal_digest =
        std::get_if<primitives::Seal>(&header.digest.back());
    if (seal_digest == nullptr) {
      return VerificationError::UNSEALED_HEADER;
    }
    if (seal_digest->consensus_engine_id != kEngineId) {
      return VerificationError::WRONG_ENGINE_SEAL;
    }

    auto seal_res = decodeSeal(seal_digest->data.view());
    if (seal_res.has_error()) {
      SL_DEBUG(log_, "Seal is undecodable: {}", seal_res.error());
      return VerificationError::INVALID_SEAL_ENCODING;
    }
    const auto &seal = seal_res.value();

    primitives::Seal popped = *seal_digest;
    header.digest.pop_back();

    auto pre_seal_hash = primitives::calculateBlockHash(header, *hasher_);

    auto verified = block_authority_.verify(pre_seal_hash, seal);
    if (not verified.has_value() or not verified.value()) {
      header.digest.emplace_back(std::move(popped));
      return VerificationError::INVALID_SEAL_SIGNATURE;
    }

    return popped;
  }

  outcome::result<BlockImportParams> SealVerifier::verify(
      BlockOrigin origin,
      primitives::BlockHeader header,
      std::optional<primitives::Justification> justification,
      std::optional<primitives::BlockBody> body) {
    auto post_hash = primitives::calculateBlockHash(header, *hasher_);

    OUTCOME_TRY(seal, checkHeader(header));

    SL_TRACE(log_,
             "Checked seal of block {}",
             primitives::BlockInfo(header.number, post_hash));

    BlockImportParams params{
        .origin = origin,
        .header = std::move(header),
        .post_digests = {std::move(seal)},
        .body = std::move(body),
        .justification = std::move(justification),
        .post_hash = post_hash,
        .finalized = false,
        .fork_choice = ForkChoiceStrategy::kLongestChain,
    };
    return params;
  }

}  // namespace singleton::consensus
