/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/import_queue.hpp"

#include <memory>
#include <mutex>

#include "consensus/verifier.hpp"
#include "log/logger.hpp"

namespace singleton::consensus {

  class ImportQueueImpl : public ImportQueue {
   public:
    ImportQueueImpl(std::shared_ptr<Verifier> verifier,
                    std::shared_ptr<BlockImport> block_import);

    outcome::result<ImportResult> importBlock(
        BlockOrigin origin,
        primitives::BlockHeader header,
        std::optional<primitives::Justification> justification,
        std::optional<primitives::BlockBody> body) override;

   private:
    std::shared_ptr<Verifier> verifier_;
    std::shared_ptr<BlockImport> block_import_;
    // blocks are imported one by one
    std::mutex import_mutex_;
    log::Logger log_;
  };

}  // namespace singleton::consensus
