/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/multi/multihash.hpp>
#include <libp2p/peer/peer_id.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"

using namespace singleton::common::literals;

inline singleton::common::Hash256 operator"" _hash256(const char *c,
                                                      size_t s) {
  singleton::common::Hash256 hash{};
  std::copy_n(c, std::min(s, 32ul), hash.rbegin());
  return hash;
}

inline libp2p::peer::PeerId operator""_peerid(const char *c, size_t s) {
  singleton::common::Hash256 digest{};
  std::copy_n(c, std::min(s, 32ul), digest.begin());
  auto multihash =
      libp2p::multi::Multihash::create(libp2p::multi::HashType::sha256, digest)
          .value();
  return libp2p::peer::PeerId::fromHash(multihash).value();
}
