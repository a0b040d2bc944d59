/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "common/buffer.hpp"

namespace singleton::primitives {
  /// Key-value writes produced by building a block, nullopt erases the key
  using StorageChanges =
      std::vector<std::pair<common::Buffer, std::optional<common::Buffer>>>;
}  // namespace singleton::primitives
