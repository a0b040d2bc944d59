/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/impl/import_queue_impl.hpp"

#include <boost/assert.hpp>

namespace singleton::consensus {

  ImportQueueImpl::ImportQueueImpl(std::shared_ptr<Verifier> verifier,
                                   std::shared_ptr<BlockImport> block_import)
      : verifier_(std::move(verifier)),
        block_import_(std::move(block_import)),
        log_(log::createLogger("ImportQueue", "import_queue")) {
    BOOST_ASSERT(verifier_ != nullptr);
    BOOST_ASSERT(block_import_ != nullptr);
  }

  outcome::result<ImportResult> ImportQueueImpl::importBlock(
      BlockOrigin origin,
      primitives::BlockHeader header,
      std::optional<primitives::Justification> justification,
      std::optional<primitives::BlockBody> body) {
    std::lock_guard lock(import_mutex_);

    auto number = header.number;
    auto params_res = verifier_->verify(
        origin, std::move(header), std::move(justification), std::move(body));
    if (params_res.has_error()) {
      SL_WARN(log_,
              "Verification of block #{} failed: {}",
              number,
              params_res.error());
      return params_res.as_failure();
    }
    auto &params = params_res.value();

    BlockCheckParams check_params{
        .hash = params.post_hash.value(),
        .number = params.header.number,
        .parent_hash = params.header.parent_hash,
    };
    OUTCOME_TRY(check_result, block_import_->checkBlock(check_params));
    if (check_result != ImportResult::kImported) {
      SL_DEBUG(log_,
               "Block {} is not imported, check result {}",
               primitives::BlockInfo(check_params.number, check_params.hash),
               static_cast<int>(check_result));
      return check_result;
    }

    auto block_info =
        primitives::BlockInfo(check_params.number, check_params.hash);
    auto import_res = block_import_->importBlock(std::move(params));
    if (import_res.has_error()) {
      SL_WARN(log_,
              "Import of block {} failed: {}",
              block_info,
              import_res.error());
      return import_res.as_failure();
    }

    SL_DEBUG(log_, "Imported block {}", block_info);
    return import_res;
  }

}  // namespace singleton::consensus
