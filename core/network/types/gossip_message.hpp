/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "common/buffer.hpp"
#include "primitives/digest.hpp"

namespace singleton::network {

  /**
   * Envelope of consensus traffic flooded over a gossip topic
   */
  struct GossipMessage {
    /// engine the body belongs to
    primitives::ConsensusEngineId engine_id;
    std::string protocol_name;
    common::Buffer body;

    bool operator==(const GossipMessage &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const GossipMessage &m) {
    return s << m.engine_id << m.protocol_name << m.body;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, GossipMessage &m) {
    return s >> m.engine_id >> m.protocol_name >> m.body;
  }

}  // namespace singleton::network
