/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace singleton::clock {

  /// Reads std::chrono::steady_clock
  class SteadyClockImpl final : public SteadyClock {
   public:
    TimePoint now() const override;
  };

}  // namespace singleton::clock
