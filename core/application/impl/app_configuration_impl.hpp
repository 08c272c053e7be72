/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include "log/logger.hpp"

namespace subcodec::application {

  class AppConfigurationImpl final : public AppConfiguration {
   public:
    AppConfigurationImpl();
    ~AppConfigurationImpl() override = default;

    /**
     * @return true if the arguments are consistent and the command may run,
     * false on error or after printing help
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    Command command() const override {
      return command_;
    }
    const std::optional<std::string> &value() const override {
      return value_;
    }
    scale::UintWidth width() const override {
      return width_;
    }
    uint16_t ss58Format() const override {
      return ss58_format_;
    }
    bool optional() const override {
      return optional_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    static std::optional<Command> parseCommand(std::string_view name);
    static std::optional<scale::UintWidth> parseWidth(uint32_t bits);
    /// Optional minus sign followed by digits, returned without leading
    /// zeros. Negatives are rejected later by the encoder.
    static std::optional<std::string> normalizeDecimal(std::string_view str);

    log::Logger logger_;

    Command command_{Command::DecodeSs58};
    std::optional<std::string> value_;
    scale::UintWidth width_{scale::UintWidth::U128};
    uint16_t ss58_format_{kDefaultSs58Format};
    bool optional_{false};
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace subcodec::application
