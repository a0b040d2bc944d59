/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

extern "C" {
#include <schnorrkel/schnorrkel.h>
}

#include "common/blob.hpp"

namespace singleton::crypto {
  namespace constants::sr25519 {
    /**
     * Important constants to deal with sr25519
     */
    enum {
      KEYPAIR_SIZE = SR25519_KEYPAIR_SIZE,
      SECRET_SIZE = SR25519_SECRET_SIZE,
      PUBLIC_SIZE = SR25519_PUBLIC_SIZE,
      SIGNATURE_SIZE = SR25519_SIGNATURE_SIZE,
      SEED_SIZE = SR25519_SEED_SIZE
    };
  }  // namespace constants::sr25519
}  // namespace singleton::crypto

SINGLETON_BLOB_STRICT_TYPEDEF(singleton::crypto,
                              Sr25519SecretKey,
                              constants::sr25519::SECRET_SIZE);
SINGLETON_BLOB_STRICT_TYPEDEF(singleton::crypto,
                              Sr25519PublicKey,
                              constants::sr25519::PUBLIC_SIZE);
SINGLETON_BLOB_STRICT_TYPEDEF(singleton::crypto,
                              Sr25519Signature,
                              constants::sr25519::SIGNATURE_SIZE);
SINGLETON_BLOB_STRICT_TYPEDEF(singleton::crypto,
                              Sr25519Seed,
                              constants::sr25519::SEED_SIZE);

namespace singleton::crypto {
  struct Sr25519Keypair {
    Sr25519SecretKey secret_key;
    Sr25519PublicKey public_key;

    bool operator==(const Sr25519Keypair &other) const = default;
  };
}  // namespace singleton::crypto
