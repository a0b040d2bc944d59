/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "blockchain/block_tree_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::blockchain, BlockTreeError, e) {
  using E = singleton::blockchain::BlockTreeError;
  switch (e) {
    case E::NO_PARENT:
      return "block, which should have been added, has no known parent";
    case E::HEADER_NOT_FOUND:
      return "the requested block header is not found in the tree";
    case E::BODY_NOT_FOUND:
      return "the requested block body is not found in the tree";
    case E::JUSTIFICATION_NOT_FOUND:
      return "the requested justification is not found in the tree";
    case E::WRONG_BLOCK_NUMBER:
      return "block number is not the number of its parent plus one";
  }
  return "unknown error";
}
