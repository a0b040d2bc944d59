/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace singleton::crypto {

  /**
   * Hash used for block identities, the pre-hash signed by a seal and gossip
   * topic names. All nodes of a network must agree on it.
   */
  class Hasher {
   public:
    virtual ~Hasher() = default;

    virtual common::Hash256 sha2_256(common::BufferView data) const = 0;
  };

}  // namespace singleton::crypto
