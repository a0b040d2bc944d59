/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "clock/timer.hpp"

namespace singleton::clock {

  /// Timer whose handlers run on the given io_context
  class BasicWaitableTimer final : public Timer {
   public:
    explicit BasicWaitableTimer(
        std::shared_ptr<boost::asio::io_context> io_context);

    void expiresAfter(SteadyClock::Duration duration) override;

    void cancel() override;

    void asyncWait(const WaitHandler &handler) override;

   private:
    // keeps the context alive as long as the timer
    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::steady_timer timer_;
  };

}  // namespace singleton::clock
