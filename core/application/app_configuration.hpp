/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "scale/primitive_encoder.hpp"

namespace subcodec::application {

  enum class Command {
    DecodeSs58,
    EncodeSs58,
    EncodeUint,
    EncodeString,
    EncodeAddress,
  };

  /**
   * Parsed command line of the codec tool
   */
  class AppConfiguration {
   public:
    static constexpr uint16_t kDefaultSs58Format = 42;

    virtual ~AppConfiguration() = default;

    virtual Command command() const = 0;

    /**
     * @return positional value the command operates on, none when it was
     * omitted for an optional input
     */
    virtual const std::optional<std::string> &value() const = 0;

    /**
     * @return wire width for encode-uint
     */
    virtual scale::UintWidth width() const = 0;

    /**
     * @return SS58 format for encode-ss58
     */
    virtual uint16_t ss58Format() const = 0;

    /**
     * @return true if the input should be wrapped into Option
     */
    virtual bool optional() const = 0;

    /**
     * @return log level overrides in form `<level>` or `<group>=<level>`
     */
    virtual const std::vector<std::string> &log() const = 0;
  };

}  // namespace subcodec::application
