/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string_view>

#include "primitives/digest.hpp"

namespace singleton::consensus {
  using namespace std::chrono_literals;

  /// Tag of seal digests, justifications and gossip messages of this engine
  inline const primitives::ConsensusEngineId kEngineId{
      std::array<uint8_t, 4>{'s', 'g', 't', 'n'}};

  /// Protocol name carried by finality gossip envelopes
  constexpr std::string_view kFinalityProtocolName = "/singleton/finality/1";

  /// Topic of finality messages is the hash of this string
  constexpr std::string_view kFinalityTopic = "singleton-finality";

  /// Period of the authoring loop
  constexpr auto kBlockAuthoringInterval = 3000ms;

  /// How long a proposer may spend building a block
  constexpr auto kProposalTimeBudget = 2000ms;
}  // namespace singleton::consensus
