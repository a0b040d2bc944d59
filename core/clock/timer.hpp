/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>

#include <boost/system/error_code.hpp>

#include "clock/clock.hpp"

namespace singleton::clock {

  /**
   * One-shot asynchronous timer. Re-arming is done by calling expiresAfter()
   * and asyncWait() again, usually from inside the handler.
   */
  struct Timer {
    /// Receives operation_aborted when the wait is cancelled
    using WaitHandler = std::function<void(const boost::system::error_code &)>;

    virtual ~Timer() = default;

    /// Moves the expiry; a pending wait is cancelled
    virtual void expiresAfter(SteadyClock::Duration duration) = 0;

    virtual void cancel() = 0;

    virtual void asyncWait(const WaitHandler &handler) = 0;
  };

}  // namespace singleton::clock
