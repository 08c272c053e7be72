/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace subcodec::crypto {
  class Hasher;
}

namespace subcodec::primitives {

  enum class Ss58Error {
    INVALID_LENGTH = 1,
    INVALID_CHECKSUM,
    RESERVED_FORMAT,
    INVALID_PREFIX,
    INVALID_FORMAT,
  };

  /// Literal hashed in front of the address body to get its checksum
  constexpr std::string_view kSs58ChecksumPrefix = "SS58PRE";

  /// Formats up to this value are encoded with a single prefix byte
  constexpr uint16_t kSs58MaxSimpleFormat = 63;
  constexpr uint16_t kSs58MaxFormat = 16383;
  constexpr size_t kSs58MaxChecksumLength = 8;

  struct Ss58Prefix {
    /// 1 or 2 bytes
    size_t length;
    uint16_t format;

    bool operator==(const Ss58Prefix &) const = default;
  };

  struct Ss58Address {
    uint16_t format;
    common::Buffer account;
  };

  /**
   * Reads the format prefix of a raw (base58-decoded) SS58 address.
   * Bit 0x40 of the first byte selects the two-byte form, which carries a
   * 14-bit format.
   */
  outcome::result<Ss58Prefix> parseSs58Prefix(common::BufferView raw);

  outcome::result<common::Buffer> encodeSs58Prefix(uint16_t format);

  /**
   * @return checksum length for a raw address of {@param total_length} bytes
   * with a prefix of {@param prefix_length} bytes, none if no address of such
   * length exists
   */
  std::optional<size_t> ss58ChecksumLength(size_t total_length,
                                           size_t prefix_length);

  bool isReservedSs58Format(uint16_t format);

  /**
   * Decodes and verifies SS58 account addresses.
   * https://docs.substrate.io/reference/address-formats/
   */
  class Ss58Codec {
   public:
    explicit Ss58Codec(std::shared_ptr<crypto::Hasher> hasher);

    /**
     * Return the format and the account id part of the provided ss58
     * address. The checksum is verified in the process.
     */
    outcome::result<Ss58Address> decodeAddress(std::string_view address) const;

    /**
     * Return the account id part of the provided ss58 address
     */
    outcome::result<common::Buffer> decode(std::string_view address) const;

    /**
     * Same as decode, wrapped into Option: an empty address gives 0x00,
     * otherwise 0x01 is followed by the account id
     */
    outcome::result<common::Buffer> decodeOptional(
        std::string_view address) const;

    outcome::result<std::string> encode(uint16_t format,
                                        common::BufferView account) const;

   private:
    common::Buffer calculateChecksum(common::BufferView body,
                                     size_t length) const;

    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger logger_;
  };

}  // namespace subcodec::primitives

OUTCOME_HPP_DECLARE_ERROR(subcodec::primitives, Ss58Error);
