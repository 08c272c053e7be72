/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace subcodec::log {

  /**
   * Logging configuration with the embedded group tree of the codec. A custom
   * YAML file may replace it.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
    using PrevConfigurator = soralog::Configurator;

   public:
    Configurator(std::shared_ptr<PrevConfigurator> previous);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::string config);

    explicit Configurator(std::shared_ptr<PrevConfigurator> previous,
                          std::filesystem::path path);

    /// Path passed with `--logcfg`, if any
    static std::optional<std::filesystem::path> getLogConfigFile(
        int argc, const char **argv);
  };

}  // namespace subcodec::log
