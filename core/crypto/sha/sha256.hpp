/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace singleton::crypto {

  /// SHA2-256 over OpenSSL's EVP interface
  common::Hash256 sha256(common::BufferView input);

  /// Hashes the characters of the string, dev seeds are derived this way
  common::Hash256 sha256(std::string_view input);

}  // namespace singleton::crypto
