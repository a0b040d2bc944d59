/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/inherent_data.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(singleton::primitives, InherentDataError, e) {
  using E = singleton::primitives::InherentDataError;
  switch (e) {
    case E::IDENTIFIER_ALREADY_EXISTS:
      return "inherent with this identifier is already put";
    case E::IDENTIFIER_DOES_NOT_EXIST:
      return "no inherent with this identifier";
  }
  return "unknown InherentDataError";
}
