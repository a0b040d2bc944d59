/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace singleton::blockchain {
  /**
   * Errors of the block tree are here, so that other modules can use them, for
   * example, to compare a received error with those
   */
  enum class BlockTreeError {
    // parent of the block is not known
    NO_PARENT = 1,
    // block header is not found in the tree
    HEADER_NOT_FOUND,
    // block body is not found in the tree
    BODY_NOT_FOUND,
    // justification is not found in the tree
    JUSTIFICATION_NOT_FOUND,
    // block number does not follow its parent
    WRONG_BLOCK_NUMBER,
  };
}  // namespace singleton::blockchain

OUTCOME_HPP_DECLARE_ERROR(singleton::blockchain, BlockTreeError)
