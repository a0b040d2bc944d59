/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "primitives/common.hpp"
#include "subscription/subscriber.hpp"
#include "subscription/subscription_engine.hpp"

namespace singleton::primitives::events {

  enum class ChainEventType : uint8_t {
    /// Every block added to the ledger, with the best-block flag attached
    kBlockImported = 1,
    /// Finalized block moved forward
    kFinalized = 2,
  };

  struct ChainEventParams {
    BlockInfo block;
    /// whether the block became the new best block; meaningful for
    /// kBlockImported only
    bool is_new_best = false;
  };

  using ChainSubscriptionEngine =
      subscription::SubscriptionEngine<ChainEventType, ChainEventParams>;
  using ChainSubscriptionEnginePtr = std::shared_ptr<ChainSubscriptionEngine>;

  using ChainEventSubscriber = ChainSubscriptionEngine::SubscriberType;
  using ChainEventSubscriberPtr = std::shared_ptr<ChainEventSubscriber>;

}  // namespace singleton::primitives::events
