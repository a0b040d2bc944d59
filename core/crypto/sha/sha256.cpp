/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <stdexcept>

#include <openssl/evp.h>

namespace singleton::crypto {

  common::Hash256 sha256(common::BufferView input) {
    common::Hash256 digest;
    unsigned int length = 0;
    if (EVP_Digest(input.data(),
                   input.size(),
                   digest.data(),
                   &length,
                   EVP_sha256(),
                   nullptr)
            != 1
        or length != digest.size()) {
      throw std::runtime_error("OpenSSL failed to compute sha2-256");
    }
    return digest;
  }

  common::Hash256 sha256(std::string_view input) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    auto bytes = reinterpret_cast<const uint8_t *>(input.data());
    return sha256(common::BufferView{bytes, input.size()});
  }

}  // namespace singleton::crypto
