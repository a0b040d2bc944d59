/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "primitives/digest.hpp"

namespace singleton::primitives {
  /**
   * Finality proof of a block, tagged with the engine that produced it.
   * Contents are opaque to the ledger.
   */
  struct Justification {
    ConsensusEngineId engine_id;
    common::Buffer data;

    bool operator==(const Justification &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Justification &v) {
    return s << v.engine_id << v.data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Justification &v) {
    return s >> v.engine_id >> v.data;
  }
}  // namespace singleton::primitives
