/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"

// Public keys of the two roles are distinct types, so one can not be passed
// where the other is expected
SINGLETON_BLOB_STRICT_TYPEDEF(singleton::consensus,
                              BlockAuthorityId,
                              crypto::constants::sr25519::PUBLIC_SIZE);
SINGLETON_BLOB_STRICT_TYPEDEF(singleton::consensus,
                              FinalityAuthorityId,
                              crypto::constants::sr25519::PUBLIC_SIZE);

namespace singleton::consensus {
  /**
   * Public part of the consensus configuration, fixed for the node lifetime
   */
  struct SingletonConfig {
    BlockAuthorityId block_authority;
    FinalityAuthorityId finality_authority;
  };
}  // namespace singleton::consensus
