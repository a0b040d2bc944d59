/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sr25519/sr25519_provider_impl.hpp"

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(singleton::crypto, Sr25519ProviderError, e) {
  using E = singleton::crypto::Sr25519ProviderError;
  switch (e) {
    case E::SIGN_EMPTY_KEYPAIR:
      return "cannot sign with an empty sr25519 keypair";
  }
  return "unknown Sr25519ProviderError";
}

namespace singleton::crypto {

  Sr25519Keypair Sr25519ProviderImpl::generateKeypair(
      const Sr25519Seed &seed) const {
    namespace sizes = constants::sr25519;
    // schnorrkel lays the keypair out as secret key followed by public key
    std::array<uint8_t, sizes::KEYPAIR_SIZE> raw{};
    sr25519_keypair_from_seed(raw.data(), seed.data());

    auto public_begin = std::next(raw.begin(), sizes::SECRET_SIZE);
    Sr25519Keypair keypair;
    std::copy(raw.begin(), public_begin, keypair.secret_key.begin());
    std::copy_n(public_begin, sizes::PUBLIC_SIZE, keypair.public_key.begin());
    return keypair;
  }

  outcome::result<Sr25519Signature> Sr25519ProviderImpl::sign(
      const Sr25519Keypair &keypair, common::BufferView message) const {
    if (keypair == Sr25519Keypair{}) {
      return Sr25519ProviderError::SIGN_EMPTY_KEYPAIR;
    }
    Sr25519Signature signature;
    sr25519_sign(signature.data(),
                 keypair.public_key.data(),
                 keypair.secret_key.data(),
                 message.data(),
                 message.size());
    return signature;
  }

  outcome::result<bool> Sr25519ProviderImpl::verify(
      const Sr25519Signature &signature,
      common::BufferView message,
      const Sr25519PublicKey &public_key) const {
    return sr25519_verify(
        signature.data(), message.data(), message.size(), public_key.data());
  }

}  // namespace singleton::crypto
