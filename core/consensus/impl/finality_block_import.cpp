/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/finality_block_import.hpp"

#include <boost/assert.hpp>

#include "consensus/seal_codec.hpp"

namespace singleton::consensus {

  FinalityBlockImport::FinalityBlockImport(
      std::shared_ptr<BlockImport> inner,
      FinalityAuthority finality_authority,
      std::shared_ptr<crypto::Hasher> hasher)
      : inner_(std::move(inner)),
        finality_authority_(std::move(finality_authority)),
        hasher_(std::move(hasher)),
        log_(log::createLogger("FinalityBlockImport", "block_import")) {
    BOOST_ASSERT(inner_ != nullptr);
    BOOST_ASSERT(hasher_ != nullptr);
  }

  outcome::result<ImportResult> FinalityBlockImport::checkBlock(
      const BlockCheckParams &params) {
    auto res = inner_->checkBlock(params);
    if (res.has_error()) {
      SL_WARN(log_, "Check of block {} failed: {}", params.hash, res.error());
      return BlockImportError::CLIENT_CHECK;
    }
    return res;
  }

  void FinalityBlockImport::applyJustification(
      BlockImportParams &params) const {
    if (not params.justification.has_value()) {
      return;
    }

    auto block_hash = params.post_hash.has_value()
                        ? params.post_hash.value()
                        : primitives::calculateBlockHash(params.postHeader(),
                                                         *hasher_);

    auto justification_res = decodeJustification(params.justification.value());
    if (justification_res.has_error()) {
      SL_DEBUG(log_,
               "Justification of block {} is ignored: {}",
               block_hash,
               justification_res.error());
      return;
    }
    const auto &justification = justification_res.value();

    auto verified = finality_authority_.verify(block_hash, justification);
    if (not verified.has_value() or not verified.value()) {
      SL_WARN(log_,
              "Invalid finality justification provided for {}",
              block_hash);
      return;
    }

    params.justification = makeJustification(justification);
    params.finalized = true;
    SL_DEBUG(log_, "Block {} comes with a valid justification", block_hash);
  }

  outcome::result<ImportResult> FinalityBlockImport::importBlock(
      BlockImportParams params) {
    applyJustification(params);

    auto header_number = params.header.number;
    auto res = inner_->importBlock(std::move(params));
    if (res.has_error()) {
      SL_WARN(log_,
              "Import of block #{} failed: {}",
              header_number,
              res.error());
      return BlockImportError::CLIENT_IMPORT;
    }
    return res;
  }

}  // namespace singleton::consensus
