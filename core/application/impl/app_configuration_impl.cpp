/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include <boost/program_options.hpp>

#include "primitives/ss58_codec.hpp"

namespace subcodec::application {

  AppConfigurationImpl::AppConfigurationImpl()
      : logger_(log::createLogger("AppConfiguration", "application")) {}

  std::optional<Command> AppConfigurationImpl::parseCommand(
      std::string_view name) {
    if (name == "decode-ss58") {
      return Command::DecodeSs58;
    }
    if (name == "encode-ss58") {
      return Command::EncodeSs58;
    }
    if (name == "encode-uint") {
      return Command::EncodeUint;
    }
    if (name == "encode-string") {
      return Command::EncodeString;
    }
    if (name == "encode-address") {
      return Command::EncodeAddress;
    }
    return std::nullopt;
  }

  std::optional<scale::UintWidth> AppConfigurationImpl::parseWidth(
      uint32_t bits) {
    switch (bits) {
      case 32:
        return scale::UintWidth::U32;
      case 64:
        return scale::UintWidth::U64;
      case 128:
        return scale::UintWidth::U128;
      default:
        return std::nullopt;
    }
  }

  std::optional<std::string> AppConfigurationImpl::normalizeDecimal(
      std::string_view str) {
    bool negative = not str.empty() and str.front() == '-';
    if (negative) {
      str.remove_prefix(1);
    }
    if (str.empty()
        or not std::all_of(str.begin(), str.end(), [](char c) {
             return c >= '0' and c <= '9';
           })) {
      return std::nullopt;
    }
    // a leading zero would switch the integer parser to octal
    auto digits = str.find_first_not_of('0');
    if (digits == std::string_view::npos) {
      return "0";
    }
    str.remove_prefix(digits);
    return (negative ? "-" : "") + std::string(str);
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lss58=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Filepath to load logging configuration (YAML) from.")
        ;

    po::options_description codec_desc("Codec options");
    codec_desc.add_options()
        ("width,w", po::value<uint32_t>()->default_value(128), "encode-uint: integer width in bits [32, 64, 128]")
        ("format,f", po::value<uint32_t>()->default_value(kDefaultSs58Format), "encode-ss58: SS58 format [0..16383]")
        ("optional", po::bool_switch(), "decode-ss58, encode-address: wrap the value into Option, a missing value encodes None")
        ;

    po::options_description hidden_desc("Positional");
    hidden_desc.add_options()
        ("command", po::value<std::string>(), "decode-ss58 | encode-ss58 | encode-uint | encode-string | encode-address")
        ("value", po::value<std::string>(), "value to encode or decode")
        ;
    // clang-format on

    po::positional_options_description positional;
    positional.add("command", 1).add("value", 1);

    po::options_description all;
    all.add(desc).add(codec_desc).add(hidden_desc);

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(all)
                    .positional(positional)
                    .run(),
                vm);
      po::notify(vm);
    } catch (const po::error &e) {
      SL_ERROR(logger_, "Invalid arguments: {}", e.what());
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << "Usage: subcodec <command> [options] [value]\n"
                << desc << codec_desc;
      return false;
    }

    if (auto it = vm.find("log"); it != vm.end()) {
      logger_tuning_config_ = it->second.as<std::vector<std::string>>();
    }

    auto command_it = vm.find("command");
    if (command_it == vm.end()) {
      SL_ERROR(logger_, "Command is not specified, run with --help");
      return false;
    }
    auto &command_name = command_it->second.as<std::string>();
    auto command = parseCommand(command_name);
    if (not command.has_value()) {
      SL_ERROR(logger_, "Unknown command: {}", command_name);
      return false;
    }
    command_ = *command;

    auto bits = vm["width"].as<uint32_t>();
    auto width = parseWidth(bits);
    if (not width.has_value()) {
      SL_ERROR(logger_, "Unsupported integer width: {}", bits);
      return false;
    }
    width_ = *width;

    auto format = vm["format"].as<uint32_t>();
    if (format > primitives::kSs58MaxFormat) {
      SL_ERROR(logger_,
               "SS58 format {} is out of range, max is {}",
               format,
               primitives::kSs58MaxFormat);
      return false;
    }
    ss58_format_ = static_cast<uint16_t>(format);

    optional_ = vm["optional"].as<bool>();

    if (auto it = vm.find("value"); it != vm.end()) {
      value_ = it->second.as<std::string>();
    }

    bool may_omit_value =
        optional_
        and (command_ == Command::DecodeSs58
             or command_ == Command::EncodeAddress);
    if (not value_.has_value() and not may_omit_value) {
      SL_ERROR(logger_, "Command {} requires a value", command_name);
      return false;
    }

    if (command_ == Command::EncodeUint) {
      auto decimal = normalizeDecimal(*value_);
      if (not decimal.has_value()) {
        SL_ERROR(logger_, "Value {} is not a decimal integer", *value_);
        return false;
      }
      value_ = std::move(*decimal);
    }

    return true;
  }

}  // namespace subcodec::application
