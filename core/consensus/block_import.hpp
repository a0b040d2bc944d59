/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/block.hpp"
#include "primitives/justification.hpp"
#include "primitives/storage_changes.hpp"

namespace singleton::consensus {

  enum class BlockImportError {
    CLIENT_IMPORT = 1,  // ledger failed to import the block
    CLIENT_CHECK,       // ledger failed to check the block
  };

  /// Where a block came from
  enum class BlockOrigin : uint8_t {
    kGenesis,
    kNetworkInitialSync,
    kNetworkBroadcast,
    kConsensusBroadcast,
    kOwn,
    kFile,
  };

  /// Rule the ledger applies to pick the best block
  enum class ForkChoiceStrategy : uint8_t {
    /// Higher block wins, no weight comparison
    kLongestChain,
  };

  /// What happened to an import request
  enum class ImportResult : uint8_t {
    kImported,
    kAlreadyInChain,
    kKnownBad,
    kUnknownParent,
  };

  /**
   * Everything the ledger needs to store a block
   */
  struct BlockImportParams {
    BlockOrigin origin = BlockOrigin::kOwn;
    /// header without post-digests
    primitives::BlockHeader header;
    /// digests appended after the header was built, the seal goes here
    std::vector<primitives::DigestItem> post_digests{};
    std::optional<primitives::BlockBody> body{};
    std::optional<primitives::Justification> justification{};
    primitives::StorageChanges storage_changes{};
    /// hash of the header with post-digests appended
    std::optional<primitives::BlockHash> post_hash{};
    /// the ledger finalizes the block together with the import
    bool finalized = false;
    std::optional<ForkChoiceStrategy> fork_choice{};

    /// Header with the post-digests put back, i.e. the form seen on the wire
    primitives::BlockHeader postHeader() const {
      auto post_header = header;
      post_header.digest.insert(
          post_header.digest.end(), post_digests.begin(), post_digests.end());
      return post_header;
    }
  };

  /// Availability check of a block before it is imported
  struct BlockCheckParams {
    primitives::BlockHash hash;
    primitives::BlockNumber number{};
    primitives::BlockHash parent_hash;
  };

  /**
   * Commits blocks to storage
   */
  class BlockImport {
   public:
    virtual ~BlockImport() = default;

    virtual outcome::result<ImportResult> checkBlock(
        const BlockCheckParams &params) = 0;

    virtual outcome::result<ImportResult> importBlock(
        BlockImportParams params) = 0;
  };

}  // namespace singleton::consensus

OUTCOME_HPP_DECLARE_ERROR(singleton::consensus, BlockImportError);
