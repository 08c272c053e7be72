/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <boost/assert.hpp>
#include <iostream>
#include <libp2p/log/logger.hpp>

#include "log/logger.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subcodec::log, Error, e) {
  using E = subcodec::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
  }
  return "Unknown log::Error";
}

namespace subcodec::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem>
    ensure_logger_system_is_initialized() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(
          logging_system,
          "Logging system is not ready. "
          "subcodec::log::setLoggingSystem() must be executed once before");
      return logging_system;
    }
  }  // namespace

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    } else if (str == "debug") {
      return Level::DEBUG;
    } else if (str == "verbose") {
      return Level::VERBOSE;
    } else if (str == "info" or str == "inf") {
      return Level::INFO;
    } else if (str == "warning" or str == "warn") {
      return Level::WARN;
    } else if (str == "error" or str == "err") {
      return Level::ERROR;
    } else if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    } else if (str == "off" or str == "no") {
      return Level::OFF;
    } else {
      return Error::WRONG_LEVEL;
    }
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = logging_system;
    libp2p::log::setLoggingSystem(logging_system_.lock());
  }

  void tuneLoggingSystem(const std::vector<std::string> &cfg) {
    auto logging_system = ensure_logger_system_is_initialized();

    for (std::string_view chunk : cfg) {
      auto eq = chunk.find('=');
      if (eq == std::string_view::npos) {
        // bare level applies to the whole codec
        if (auto level = str2lvl(chunk); level.has_value()) {
          setLevelOfGroup(defaultGroupName, level.value());
        } else {
          std::cerr << "Invalid level: " << chunk << '\n';
        }
        continue;
      }

      std::string group_name{chunk.substr(0, eq)};
      if (not logging_system->getGroup(group_name)) {
        std::cerr << "Unknown group: " << group_name << '\n';
        continue;
      }
      auto level = str2lvl(chunk.substr(eq + 1));
      if (not level.has_value()) {
        std::cerr << "Invalid level for group '" << group_name
                  << "': " << chunk.substr(eq + 1) << '\n';
        continue;
      }
      logging_system->setLevelOfGroup(group_name, level.value());
    }
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

}  // namespace subcodec::log
