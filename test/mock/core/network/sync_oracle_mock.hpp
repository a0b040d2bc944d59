/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/sync_oracle.hpp"

#include <gmock/gmock.h>

namespace singleton::network {

  class SyncOracleMock : public SyncOracle {
   public:
    MOCK_METHOD(bool, isMajorSyncing, (), (const, override));
  };

}  // namespace singleton::network
