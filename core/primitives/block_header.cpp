/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/block_header.hpp"

namespace singleton::primitives {

  BlockHash calculateBlockHash(const BlockHeader &header,
                               const crypto::Hasher &hasher) {
    auto encoded_header = ::scale::encode(header).value();
    return hasher.sha2_256(encoded_header);
  }

}  // namespace singleton::primitives
