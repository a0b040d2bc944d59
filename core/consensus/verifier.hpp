/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/block_import.hpp"

namespace singleton::consensus {

  enum class VerificationError {
    UNSEALED_HEADER = 1,
    WRONG_ENGINE_SEAL,
    INVALID_SEAL_ENCODING,
    INVALID_SEAL_SIGNATURE,
  };

  /**
   * Turns a header received from somewhere into an import request, or
   * rejects it
   */
  class Verifier {
   public:
    virtual ~Verifier() = default;

    /**
     * @param origin where the block came from
     * @param header sealed header
     * @param justification justification received along with the block
     * @param body block body if known
     * @return import request with the seal moved to post-digests
     */
    virtual outcome::result<BlockImportParams> verify(
        BlockOrigin origin,
        primitives::BlockHeader header,
        std::optional<primitives::Justification> justification,
        std::optional<primitives::BlockBody> body) = 0;
  };

}  // namespace singleton::consensus

OUTCOME_HPP_DECLARE_ERROR(singleton::consensus, VerificationError);
