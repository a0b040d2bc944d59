/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/block_import.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::consensus, BlockImportError, e) {
  using E = singleton::consensus::BlockImportError;
  switch (e) {
    case E::CLIENT_IMPORT:
      return "Ledger failed to import the block";
    case E::CLIENT_CHECK:
      return "Ledger failed to check the block";
  }
  return "Unknown BlockImportError";
}
