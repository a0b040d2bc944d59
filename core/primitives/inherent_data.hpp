/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include <scale/scale.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace singleton::primitives {

  enum class InherentDataError {
    IDENTIFIER_ALREADY_EXISTS = 1,
    IDENTIFIER_DOES_NOT_EXIST,
  };

  /// Eight bytes naming an inherent, e.g. "timstap0"
  using InherentIdentifier = common::Blob<8>;

  /**
   * Data the author injects into a block besides the transactions. Values
   * are kept scale encoded, ordered by identifier.
   */
  struct InherentData {
    std::map<InherentIdentifier, common::Buffer> data;

    /// An identifier can be put once, a second put keeps the first value
    template <typename T>
    outcome::result<void> putData(const InherentIdentifier &identifier,
                                  const T &value) {
      if (data.contains(identifier)) {
        return InherentDataError::IDENTIFIER_ALREADY_EXISTS;
      }
      OUTCOME_TRY(encoded, ::scale::encode(value));
      data.emplace(identifier, common::Buffer{std::move(encoded)});
      return outcome::success();
    }

    template <typename T>
    outcome::result<T> getData(const InherentIdentifier &identifier) const {
      auto it = data.find(identifier);
      if (it == data.end()) {
        return InherentDataError::IDENTIFIER_DOES_NOT_EXIST;
      }
      return ::scale::decode<T>(it->second);
    }

    bool operator==(const InherentData &) const = default;
  };

}  // namespace singleton::primitives

OUTCOME_HPP_DECLARE_ERROR(singleton::primitives, InherentDataError);
