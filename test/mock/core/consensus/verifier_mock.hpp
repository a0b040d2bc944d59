/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/verifier.hpp"

#include <gmock/gmock.h>

namespace singleton::consensus {

  class VerifierMock : public Verifier {
   public:
    MOCK_METHOD(outcome::result<BlockImportParams>,
                verify,
                (BlockOrigin,
                 primitives::BlockHeader,
                 std::optional<primitives::Justification>,
                 std::optional<primitives::BlockBody>),
                (override));
  };

}  // namespace singleton::consensus
