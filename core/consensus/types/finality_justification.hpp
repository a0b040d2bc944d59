/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/sr25519_types.hpp"

namespace singleton::consensus {
  /**
   * Attestation of the finality authority that a block is irreversible
   */
  struct FinalityJustification {
    /// Sig_sr25519(post-seal block hash)
    crypto::Sr25519Signature signature;

    bool operator==(const FinalityJustification &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const FinalityJustification &j) {
    return s << j.signature;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, FinalityJustification &j) {
    return s >> j.signature;
  }
}  // namespace singleton::consensus
