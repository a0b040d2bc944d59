/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace singleton::network {

  /**
   * Tells whether the node is still catching up with the network
   */
  class SyncOracle {
   public:
    virtual ~SyncOracle() = default;

    virtual bool isMajorSyncing() const = 0;
  };

}  // namespace singleton::network
