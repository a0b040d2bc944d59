/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <unordered_map>

#include <boost/assert.hpp>
#include <libp2p/log/logger.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(singleton::log, Error, e) {
  using E = singleton::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::MALFORMED_FILTER:
      return "Log filter must be `<level>` or `<group>=<level>`";
  }
  return "Unknown log::Error";
}

namespace singleton::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem>
    ensure_logger_system_is_initialized() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(
          logging_system,
          "Logging system is not ready. "
          "singleton::log::setLoggingSystem() must be executed once before");
      return logging_system;
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    static const std::unordered_map<std::string_view, Level> levels{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"warn", Level::WARN},
        {"warning", Level::WARN},
        {"error", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"off", Level::OFF},
    };
    if (auto it = levels.find(str); it != levels.end()) {
      return it->second;
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<LogFilter> parseLogFilter(std::string_view filter) {
    auto eq = filter.find('=');
    if (eq == std::string_view::npos) {
      OUTCOME_TRY(level, str2lvl(filter));
      return LogFilter{defaultGroupName, level};
    }
    auto group = filter.substr(0, eq);
    if (group.empty() or filter.find('=', eq + 1) != std::string_view::npos) {
      return Error::MALFORMED_FILTER;
    }
    OUTCOME_TRY(level, str2lvl(filter.substr(eq + 1)));
    return LogFilter{std::string(group), level};
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = logging_system;
    libp2p::log::setLoggingSystem(logging_system_.lock());
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    auto logging_system = ensure_logger_system_is_initialized();
    for (const auto &filter : filters) {
      OUTCOME_TRY(parsed, parseLogFilter(filter));
      if (not logging_system->getGroup(parsed.group)) {
        return Error::WRONG_GROUP;
      }
      logging_system->setLevelOfGroup(parsed.group, parsed.level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    auto logging_system = ensure_logger_system_is_initialized();
    return std::static_pointer_cast<soralog::LoggerFactory>(logging_system)
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    auto logging_system = ensure_logger_system_is_initialized();
    return logging_system->setLevelOfGroup(group_name, level);
  }

}  // namespace singleton::log
