/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <variant>
#include <vector>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace singleton::primitives {
  enum class DigestError : uint8_t {
    RESERVED_ITEM_TYPE = 1,
  };
}  // namespace singleton::primitives

OUTCOME_HPP_DECLARE_ERROR(singleton::primitives, DigestError);

namespace singleton::primitives {
  /// Identifier of a consensus engine, four ASCII bytes
  using ConsensusEngineId = common::Blob<4>;

  namespace detail {
    /// Item tagged with the engine it belongs to
    struct DigestItemCommon {
      ConsensusEngineId consensus_engine_id;
      common::Buffer data;

      bool operator==(const DigestItemCommon &rhs) const = default;
    };

    template <class Stream,
              typename = std::enable_if_t<Stream::is_encoder_stream>>
    Stream &operator<<(Stream &s, const DigestItemCommon &dic) {
      return s << dic.consensus_engine_id << dic.data;
    }

    template <class Stream,
              typename = std::enable_if_t<Stream::is_decoder_stream>>
    Stream &operator>>(Stream &s, DigestItemCommon &dic) {
      return s >> dic.consensus_engine_id >> dic.data;
    }
  }  // namespace detail

  /// Consensus message for the runtime or other consumers
  struct Consensus : public detail::DigestItemCommon {};

  /// Put into the header by its author, removed by the verifier before the
  /// header is hashed for signature checks
  struct Seal : public detail::DigestItemCommon {};

  /// Pre-runtime digest, inserted by the block producer before execution
  struct PreRuntime : public detail::DigestItemCommon {};

  /// Anything without a consensus engine attached
  struct Other {
    common::Buffer data;

    bool operator==(const Other &rhs) const = default;
  };

  template <class Stream,
            typename = std::enable_if_t<Stream::is_encoder_stream>>
  Stream &operator<<(Stream &s, const Other &v) {
    return s << v.data;
  }

  template <class Stream,
            typename = std::enable_if_t<Stream::is_decoder_stream>>
  Stream &operator>>(Stream &s, Other &v) {
    return s >> v.data;
  }

  /// Placeholder of a digest type tag nobody may use; neither encodes nor
  /// decodes
  template <uint8_t Tag>
  struct Reserved {
    bool operator==(const Reserved &) const = default;
  };

  template <uint8_t Tag>
  [[noreturn]] ::scale::ScaleEncoderStream &operator<<(
      ::scale::ScaleEncoderStream &, const Reserved<Tag> &) {
    ::scale::raise(DigestError::RESERVED_ITEM_TYPE);
  }

  template <uint8_t Tag>
  [[noreturn]] ::scale::ScaleDecoderStream &operator>>(
      ::scale::ScaleDecoderStream &, Reserved<Tag> &) {
    ::scale::raise(DigestError::RESERVED_ITEM_TYPE);
  }

  /// Digest item of a block header. The variant index is the wire type tag.
  using DigestItem = std::variant<Other,        // 0
                                  Reserved<1>,  // 1
                                  Reserved<2>,  // 2
                                  Reserved<3>,  // 3
                                  Consensus,    // 4
                                  Seal,         // 5
                                  PreRuntime>;  // 6

  /**
   * Digest is an implementation- and usage-defined entity, for example,
   * information, needed to verify the block
   */
  using Digest = std::vector<DigestItem>;

}  // namespace singleton::primitives
