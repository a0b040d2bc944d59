/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace singleton::crypto {

  class HasherImpl final : public Hasher {
   public:
    common::Hash256 sha2_256(common::BufferView data) const override;
  };

}  // namespace singleton::crypto
