/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "consensus/types/finality_justification.hpp"
#include "consensus/types/seal.hpp"
#include "outcome/outcome.hpp"
#include "primitives/digest.hpp"
#include "primitives/justification.hpp"

namespace singleton::consensus {

  enum class SealCodecError {
    INVALID_LENGTH = 1,
    WRONG_ENGINE,
  };

  /// Payload of a seal digest item: the fixed-length signature
  common::Buffer encodeSeal(const Seal &seal);

  /// Fails unless the payload is exactly one signature
  outcome::result<Seal> decodeSeal(common::BufferView payload);

  /// Seal digest item tagged with this engine
  primitives::Seal makeSealDigest(const Seal &seal);

  common::Buffer encodeJustification(const FinalityJustification &j);

  outcome::result<FinalityJustification> decodeJustification(
      common::BufferView payload);

  /// Justification as stored in the ledger, tagged with this engine
  primitives::Justification makeJustification(const FinalityJustification &j);

  /// Decodes a ledger justification, checking the engine tag
  outcome::result<FinalityJustification> decodeJustification(
      const primitives::Justification &justification);

}  // namespace singleton::consensus

OUTCOME_HPP_DECLARE_ERROR(singleton::consensus, SealCodecError);
