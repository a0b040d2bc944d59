/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace singleton::consensus {

  /**
   * Spreads finality of blocks over gossip. Every node applies attestations
   * received from peers; the node holding the finality key also attests its
   * new best blocks.
   */
  class FinalityGadget {
   public:
    virtual ~FinalityGadget() = default;

    /// Starts the transport and the subscriptions
    virtual void start() = 0;

    virtual void stop() = 0;
  };

}  // namespace singleton::consensus
