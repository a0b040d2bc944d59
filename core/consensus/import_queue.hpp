/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/block_import.hpp"

namespace singleton::consensus {

  /**
   * Entry point for blocks coming from outside: verification, then import
   */
  class ImportQueue {
   public:
    virtual ~ImportQueue() = default;

    /**
     * Rejected blocks are logged and dropped, they are never retried
     */
    virtual outcome::result<ImportResult> importBlock(
        BlockOrigin origin,
        primitives::BlockHeader header,
        std::optional<primitives::Justification> justification,
        std::optional<primitives::BlockBody> body) = 0;
  };

}  // namespace singleton::consensus
