/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "network/gossip_transport.hpp"

namespace singleton::network {

  /**
   * Keeps every message, the consumers do the checks
   */
  class AcceptAllValidator final : public GossipValidator {
   public:
    ValidationResult validate(const Topic &,
                              const TopicNotification &) override {
      return ValidationResult::kProcessAndKeep;
    }
  };

}  // namespace singleton::network
