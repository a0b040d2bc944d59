/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "crypto/hasher.hpp"
#include "primitives/common.hpp"
#include "primitives/digest.hpp"

namespace singleton::primitives {
  /// Header of a block, the seal is the last item of the digest
  struct BlockHeader {
    BlockHash parent_hash{};
    BlockNumber number{};
    common::Hash256 state_root{};
    /// sha2-256 of the scale encoded body
    common::Hash256 extrinsics_root{};
    Digest digest{};

    bool operator==(const BlockHeader &rhs) const = default;
  };

  // the number is compact encoded
  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const BlockHeader &bh) {
    return s << bh.parent_hash << ::scale::CompactInteger(bh.number)
             << bh.state_root << bh.extrinsics_root << bh.digest;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, BlockHeader &bh) {
    ::scale::CompactInteger number;
    s >> bh.parent_hash >> number;
    bh.number = number.convert_to<BlockNumber>();
    return s >> bh.state_root >> bh.extrinsics_root >> bh.digest;
  }

  /**
   * Hash of the header in its current form. For a sealed header this is the
   * block identity, for a header with the seal removed it is the pre-hash the
   * block author signs.
   */
  BlockHash calculateBlockHash(const BlockHeader &header,
                               const crypto::Hasher &hasher);

}  // namespace singleton::primitives
