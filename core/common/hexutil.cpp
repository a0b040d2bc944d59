/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include <boost/algorithm/hex.hpp>
#include <fmt/format.h>

#include "common/buffer_view.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::common, UnhexError, e) {
  using singleton::common::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
    case UnhexError::MISSING_0X_PREFIX:
      return "Missing expected 0x prefix";
  }
  return "Unknown UnhexError";
}

namespace singleton::common {

  namespace {
    constexpr std::string_view kHexPrefix = "0x";
    constexpr size_t kShortHexThreshold = 5;
  }  // namespace

  std::string hex_lower(BufferView bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower_0x(BufferView bytes) {
    return std::string(kHexPrefix) + hex_lower(bytes);
  }

  std::string hex_short_0x(BufferView bytes) {
    if (bytes.size() <= kShortHexThreshold) {
      return hex_lower_0x(bytes);
    }
    return fmt::format("{}{}…{}",
                       kHexPrefix,
                       hex_lower(bytes.first(2)),
                       hex_lower(bytes.last(2)));
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
      return UnhexError::NOT_ENOUGH_INPUT;
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    try {
      boost::algorithm::unhex(
          hex.begin(), hex.end(), std::back_inserter(bytes));
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::NOT_ENOUGH_INPUT;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::NON_HEX_INPUT;
    }
    return bytes;
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex) {
    if (not hex.starts_with(kHexPrefix)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex.substr(kHexPrefix.size()));
  }

}  // namespace singleton::common
