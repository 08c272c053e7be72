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

#include "outcome/outcome.hpp"

namespace subcodec::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  enum class Error : uint8_t { WRONG_LEVEL = 1 };

  outcome::result<Level> str2lvl(std::string_view str);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies level overrides of form `<level>` (for the default group) or
   * `<group>=<level>`, as passed with `--log`
   */
  void tuneLoggingSystem(const std::vector<std::string> &cfg);

  static const std::string defaultGroupName("subcodec");

  /**
   * @return logger named {@param tag} attached to the group
   * {@param group} of the configured logging system
   */
  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace subcodec::log

OUTCOME_HPP_DECLARE_ERROR(subcodec::log, Error);
