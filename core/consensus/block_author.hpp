/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "consensus/constants.hpp"

namespace singleton::consensus {

  struct AuthoringConfig {
    /// period between two authoring attempts
    std::chrono::milliseconds interval = kBlockAuthoringInterval;
    std::chrono::milliseconds proposal_time_budget = kProposalTimeBudget;
    /// skip ticks while the node is syncing instead of only logging
    bool skip_while_syncing = false;
  };

  /**
   * Periodically builds, seals and imports blocks on top of the best block
   */
  class BlockAuthor {
   public:
    virtual ~BlockAuthor() = default;

    /// Schedules the first tick one interval from now
    virtual void start() = 0;

    /// No tick starts after this call
    virtual void stop() = 0;
  };

}  // namespace singleton::consensus
