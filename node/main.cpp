/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <filesystem>
#include <iostream>

#include <boost/config.hpp>
#include <libp2p/common/final_action.hpp>
#include <libp2p/log/configurator.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "crypto/hasher/hasher_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"
#include "primitives/ss58_codec.hpp"
#include "scale/primitive_encoder.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

using subcodec::application::AppConfiguration;
using subcodec::application::AppConfigurationImpl;
using subcodec::application::Command;

namespace {

  outcome::result<std::string> runCommand(const AppConfiguration &config) {
    using subcodec::common::Address20;

    auto hasher = std::make_shared<subcodec::crypto::HasherImpl>();
    subcodec::primitives::Ss58Codec ss58{hasher};

    const auto &value = config.value();

    switch (config.command()) {
      case Command::DecodeSs58: {
        if (config.optional()) {
          OUTCOME_TRY(encoded, ss58.decodeOptional(value.value_or("")));
          return encoded.toHex();
        }
        OUTCOME_TRY(account, ss58.decode(*value));
        return account.toHex();
      }

      case Command::EncodeSs58: {
        OUTCOME_TRY(account, subcodec::common::unhexMaybe0x(*value));
        return ss58.encode(config.ss58Format(), account);
      }

      case Command::EncodeUint: {
        // canonical decimal, checked by the configuration
        subcodec::scale::BigUint number{value->c_str()};
        OUTCOME_TRY(encoded,
                    subcodec::scale::encodeUnsigned(number, config.width()));
        return encoded.toHex();
      }

      case Command::EncodeString: {
        OUTCOME_TRY(encoded, subcodec::scale::encodeString(*value));
        return encoded.toHex();
      }

      case Command::EncodeAddress: {
        std::optional<Address20> address;
        if (value.has_value()) {
          OUTCOME_TRY(bytes, subcodec::common::unhexMaybe0x(*value));
          OUTCOME_TRY(parsed, Address20::fromSpan(bytes));
          address = parsed;
        }
        if (config.optional()) {
          return subcodec::scale::encodeOptionalFixedAddress(address).toHex();
        }
        return subcodec::scale::encodeFixedAddress(*address).toHex();
      }
    }
    BOOST_UNREACHABLE_RETURN({});
  }

  int run(int argc, const char **argv) {
    AppConfigurationImpl configuration;

    if (not configuration.initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    subcodec::log::tuneLoggingSystem(configuration.log());

    auto res = runCommand(configuration);
    if (res.has_error()) {
      std::cerr << "Error: " << res.error().message() << '\n';
      return EXIT_FAILURE;
    }

    if (configuration.command() == Command::EncodeSs58) {
      std::cout << res.value() << '\n';
    } else {
      std::cout << "0x" << res.value() << '\n';
    }
    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  // Logging system
  auto logging_system = [&] {
    auto custom_log_config_path =
        subcodec::log::Configurator::getLogConfigFile(argc - 1, argv + 1);
    if (custom_log_config_path.has_value()) {
      if (not std::filesystem::is_regular_file(
              custom_log_config_path.value())) {
        std::cerr << "Provided wrong path to config file of logging\n";
        exit(EXIT_FAILURE);
      }
    }

    auto libp2p_log_configurator =
        std::make_shared<libp2p::log::Configurator>();

    auto log_configurator =
        custom_log_config_path.has_value()
            ? std::make_shared<subcodec::log::Configurator>(
                  std::move(libp2p_log_configurator),
                  custom_log_config_path.value())
            : std::make_shared<subcodec::log::Configurator>(
                  std::move(libp2p_log_configurator));

    return std::make_shared<soralog::LoggingSystem>(
        std::move(log_configurator));
  }();

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  subcodec::log::setLoggingSystem(logging_system);

  return run(argc, argv);
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
