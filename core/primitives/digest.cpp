/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/digest.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::primitives, DigestError, e) {
  using E = singleton::primitives::DigestError;
  switch (e) {
    case E::RESERVED_ITEM_TYPE:
      return "digest item uses a reserved type tag";
  }
  return "unknown DigestError";
}
