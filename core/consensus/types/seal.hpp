/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"

namespace singleton::consensus {
  /**
   * Basically a signature of the block's header
   */
  struct Seal {
    /// Sig_sr25519(sha2_256(header without the seal))
    crypto::Sr25519Signature signature;

    bool operator==(const Seal &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Seal &seal) {
    return s << seal.signature;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Seal &seal) {
    return s >> seal.signature;
  }
}  // namespace singleton::consensus
