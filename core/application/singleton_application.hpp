/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace singleton::application {

  /**
   * @class SingletonApplication singleton application interface
   */
  class SingletonApplication {
   public:
    virtual ~SingletonApplication() = default;

    /**
     * Runs nodes until stop() is called or a termination signal arrives
     * @return process exit code
     */
    virtual int run() = 0;

    virtual void stop() = 0;
  };

}  // namespace singleton::application
