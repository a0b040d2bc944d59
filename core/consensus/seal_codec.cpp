/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/seal_codec.hpp"

#include <scale/scale.hpp>

#include "consensus/constants.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::consensus, SealCodecError, e) {
  using E = singleton::consensus::SealCodecError;
  switch (e) {
    case E::INVALID_LENGTH:
      return "Payload length does not match the signature size";
    case E::WRONG_ENGINE:
      return "Payload is tagged for another consensus engine";
  }
  return "Unknown SealCodecError";
}

namespace singleton::consensus {
  namespace {
    constexpr size_t kSignatureSize = crypto::Sr25519Signature::size();

    template <typename T>
    outcome::result<T> decodeFixed(common::BufferView payload) {
      if (payload.size() != kSignatureSize) {
        return SealCodecError::INVALID_LENGTH;
      }
      return ::scale::decode<T>(payload);
    }
  }  // namespace

  common::Buffer encodeSeal(const Seal &seal) {
    return common::Buffer{::scale::encode(seal).value()};
  }

  outcome::result<Seal> decodeSeal(common::BufferView payload) {
    return decodeFixed<Seal>(payload);
  }

  primitives::Seal makeSealDigest(const Seal &seal) {
    return primitives::Seal{{kEngineId, encodeSeal(seal)}};
  }

  common::Buffer encodeJustification(const FinalityJustification &j) {
    return common::Buffer{::scale::encode(j).value()};
  }

  outcome::result<FinalityJustification> decodeJustification(
      common::BufferView payload) {
    return decodeFixed<FinalityJustification>(payload);
  }

  primitives::Justification makeJustification(const FinalityJustification &j) {
    return primitives::Justification{kEngineId, encodeJustification(j)};
  }

  outcome::result<FinalityJustification> decodeJustification(
      const primitives::Justification &justification) {
    if (justification.engine_id != kEngineId) {
      return SealCodecError::WRONG_ENGINE;
    }
    return decodeJustification(justification.data.view());
  }
}  // namespace singleton::consensus
