/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace singleton::clock {

  /**
   * Monotonic time source. Deadlines of block proposals are measured against
   * it, so it must never go backwards.
   */
  class SteadyClock {
   public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;

    virtual TimePoint now() const = 0;
  };

}  // namespace singleton::clock
