/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace singleton::common {

  class BufferView;

  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
  };

  /// Lowercase hex of the bytes, no prefix
  std::string hex_lower(BufferView bytes);

  std::string hex_lower_0x(BufferView bytes);

  /**
   * Abbreviated hex used in log lines: the first and the last two bytes,
   * e.g. 0x1234…cdef. Inputs of up to 5 bytes are printed in full.
   */
  std::string hex_short_0x(BufferView bytes);

  /**
   * @brief Converts hex representation to bytes
   * @param hex hex string, both uppercase and lowercase digits are accepted
   * @return bytes if the input has even length and hex digits only
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

}  // namespace singleton::common

OUTCOME_HPP_DECLARE_ERROR(singleton::common, UnhexError);
