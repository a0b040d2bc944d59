/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/basic_waitable_timer.hpp"

#include <boost/assert.hpp>

namespace singleton::clock {

  BasicWaitableTimer::BasicWaitableTimer(
      std::shared_ptr<boost::asio::io_context> io_context)
      : io_context_{std::move(io_context)}, timer_{*io_context_} {
    BOOST_ASSERT(io_context_);
  }

  void BasicWaitableTimer::expiresAfter(SteadyClock::Duration duration) {
    timer_.expires_after(duration);
  }

  void BasicWaitableTimer::cancel() {
    timer_.cancel();
  }

  void BasicWaitableTimer::asyncWait(const WaitHandler &handler) {
    timer_.async_wait(handler);
  }

}  // namespace singleton::clock
