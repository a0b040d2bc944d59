/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::common, BlobError, e) {
  using singleton::common::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input has incorrect length, not matching the blob size";
  }
  return "Unknown BlobError";
}

template class singleton::common::Blob<4ul>;
template class singleton::common::Blob<32ul>;
template class singleton::common::Blob<64ul>;
