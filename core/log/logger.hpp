/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

// pre-include all formatters
#include "log/formatters/error_code.hpp"
#include "log/formatters/peer_id.hpp"

namespace singleton::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,
    WRONG_GROUP,
    MALFORMED_FILTER,
  };

  static const std::string defaultGroupName("singleton");

  /// Level override of one logging group
  struct LogFilter {
    std::string group;
    Level level;
  };

  outcome::result<Level> str2lvl(std::string_view str);

  /**
   * Parses a `--log` value: either a bare level, applied to the default
   * group, or `group=level`
   */
  outcome::result<LogFilter> parseLogFilter(std::string_view filter);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies `--log` filters in order
   * @return the first error, filters before it stay applied
   */
  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &filters);

  [[nodiscard]] Logger createLogger(
      const std::string &tag, const std::string &group = defaultGroupName);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace singleton::log

OUTCOME_HPP_DECLARE_ERROR(singleton::log, Error);
