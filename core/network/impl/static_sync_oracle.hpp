/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/sync_oracle.hpp"

#include <atomic>

namespace singleton::network {

  /// Sync status is whatever the owner last set
  class StaticSyncOracle final : public SyncOracle {
   public:
    explicit StaticSyncOracle(bool syncing = false) : syncing_{syncing} {}

    bool isMajorSyncing() const override {
      return syncing_.load();
    }

    void setMajorSyncing(bool syncing) {
      syncing_.store(syncing);
    }

   private:
    std::atomic_bool syncing_;
  };

}  // namespace singleton::network
