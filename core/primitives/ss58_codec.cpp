/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/ss58_codec.hpp"

#include <algorithm>
#include <array>

#include <boost/assert.hpp>
#include <libp2p/multi/multibase_codec/codecs/base58.hpp>

#include "crypto/hasher.hpp"
#include "scale/primitive_encoder.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subcodec::primitives, Ss58Error, e) {
  using E = subcodec::primitives::Ss58Error;

  switch (e) {
    case E::INVALID_LENGTH:
      return "Invalid SS58 address length";
    case E::INVALID_CHECKSUM:
      return "Invalid SS58 checksum";
    case E::RESERVED_FORMAT:
      return "Reserved SS58 format";
    case E::INVALID_PREFIX:
      return "Invalid SS58 prefix";
    case E::INVALID_FORMAT:
      return "SS58 format is out of range";
  }
  return "Unknown SS58 codec error";
}

namespace subcodec::primitives {

  namespace {
    constexpr uint8_t kTwoBytePrefixFlag = 0b0100'0000;
    constexpr uint8_t kInvalidPrefixFlag = 0b1000'0000;

    struct ChecksumRule {
      size_t length;
      // length is counted after the prefix
      bool after_prefix;
      size_t checksum_length;
    };

    // clang-format off
    constexpr std::array<ChecksumRule, 17> kChecksumRules{{
        {3, false, 1}, {4, false, 1}, {6, false, 1}, {10, false, 1},
        {5, false, 2}, {7, false, 2}, {11, false, 2},
        {34, true, 2}, {35, true, 2},
        {8, false, 3}, {12, false, 3},
        {9, false, 4}, {13, false, 4},
        {14, false, 5},
        {15, false, 6},
        {16, false, 7},
        {17, false, 8},
    }};
    // clang-format on
  }  // namespace

  outcome::result<Ss58Prefix> parseSs58Prefix(common::BufferView raw) {
    if (raw.empty()) {
      return Ss58Error::INVALID_LENGTH;
    }
    if ((raw[0] & kTwoBytePrefixFlag) == 0) {
      return Ss58Prefix{.length = 1, .format = raw[0]};
    }
    if (raw.size() < 2) {
      return Ss58Error::INVALID_LENGTH;
    }
    // b0 = 01aaaaaa, b1 = bbcccccc -> format = 00cccccc aaaaaabb
    auto lower = static_cast<uint16_t>(((raw[0] & 0b0011'1111) << 2)
                                       | (raw[1] >> 6));
    auto upper = static_cast<uint16_t>(raw[1] & 0b0011'1111);
    return Ss58Prefix{.length = 2,
                      .format = static_cast<uint16_t>(lower | (upper << 8))};
  }

  outcome::result<common::Buffer> encodeSs58Prefix(uint16_t format) {
    if (format > kSs58MaxFormat) {
      return Ss58Error::INVALID_FORMAT;
    }
    if (format <= kSs58MaxSimpleFormat) {
      return common::Buffer{static_cast<uint8_t>(format)};
    }
    // https://docs.substrate.io/fundamentals/accounts-addresses-keys/
    auto first = static_cast<uint8_t>(
        ((format & 0b0000'0000'1111'1100) >> 2) | kTwoBytePrefixFlag);
    auto second = static_cast<uint8_t>(
        (format >> 8) | ((format & 0b0000'0000'0000'0011) << 6));
    return common::Buffer{first, second};
  }

  std::optional<size_t> ss58ChecksumLength(size_t total_length,
                                           size_t prefix_length) {
    auto it = std::find_if(
        kChecksumRules.begin(),
        kChecksumRules.end(),
        [&](const ChecksumRule &rule) {
          return total_length
              == rule.length + (rule.after_prefix ? prefix_length : 0);
        });
    if (it == kChecksumRules.end()) {
      return std::nullopt;
    }
    return it->checksum_length;
  }

  bool isReservedSs58Format(uint16_t format) {
    constexpr std::array<uint16_t, 2> kReserved{46, 47};
    return std::find(kReserved.begin(), kReserved.end(), format)
        != kReserved.end();
  }

  Ss58Codec::Ss58Codec(std::shared_ptr<crypto::Hasher> hasher)
      : hasher_{std::move(hasher)},
        logger_{log::createLogger("Ss58Codec", "ss58")} {
    BOOST_ASSERT(hasher_ != nullptr);
  }

  common::Buffer Ss58Codec::calculateChecksum(common::BufferView body,
                                              size_t length) const {
    auto preimage = common::Buffer{}.put(kSs58ChecksumPrefix).put(body);
    auto hash = hasher_->blake2b_512(preimage);
    return common::Buffer{common::BufferView(hash).first(length)};
  }

  outcome::result<Ss58Address> Ss58Codec::decodeAddress(
      std::string_view address) const {
    // decode SS58 address: base58(<address-type><address><checksum>)
    OUTCOME_TRY(decoded, libp2p::multi::detail::decodeBase58(address));
    common::BufferView raw(decoded);

    OUTCOME_TRY(prefix, parseSs58Prefix(raw));

    auto checksum_length = ss58ChecksumLength(raw.size(), prefix.length);
    if (not checksum_length.has_value()) {
      SL_DEBUG(logger_,
               "No SS58 address has {} bytes with {}-byte prefix",
               raw.size(),
               prefix.length);
      return Ss58Error::INVALID_LENGTH;
    }

    if ((raw[0] & kInvalidPrefixFlag) != 0) {
      return Ss58Error::INVALID_PREFIX;
    }
    if (isReservedSs58Format(prefix.format)) {
      SL_DEBUG(logger_, "SS58 format {} is reserved", prefix.format);
      return Ss58Error::RESERVED_FORMAT;
    }

    auto body = raw.first(raw.size() - *checksum_length);
    common::BufferView checksum = raw.last(*checksum_length);
    auto calculated_checksum = calculateChecksum(body, *checksum_length);

    if (calculated_checksum.view() != checksum) {
      SL_DEBUG(logger_,
               "SS58 checksum mismatch: calculated 0x{}, embedded 0x{}",
               calculated_checksum.toHex(),
               checksum.toHex());
      return Ss58Error::INVALID_CHECKSUM;
    }

    return Ss58Address{
        .format = prefix.format,
        .account = common::Buffer{body.subspan(prefix.length)},
    };
  }

  outcome::result<common::Buffer> Ss58Codec::decode(
      std::string_view address) const {
    OUTCOME_TRY(decoded, decodeAddress(address));
    return std::move(decoded.account);
  }

  outcome::result<common::Buffer> Ss58Codec::decodeOptional(
      std::string_view address) const {
    auto maybe_address = address.empty()
                           ? std::nullopt
                           : std::optional<std::string_view>{address};
    return scale::encodeOptional(
        maybe_address, [this](std::string_view a) { return decode(a); });
  }

  outcome::result<std::string> Ss58Codec::encode(
      uint16_t format, common::BufferView account) const {
    if (isReservedSs58Format(format)) {
      return Ss58Error::RESERVED_FORMAT;
    }
    OUTCOME_TRY(prefix, encodeSs58Prefix(format));

    // pick the checksum length the decoder derives from the total length
    for (size_t checksum_length = 1; checksum_length <= kSs58MaxChecksumLength;
         ++checksum_length) {
      auto total = prefix.size() + account.size() + checksum_length;
      if (ss58ChecksumLength(total, prefix.size()) != checksum_length) {
        continue;
      }
      common::Buffer ss58_bytes;
      ss58_bytes.reserve(total).put(prefix).put(account);
      auto checksum = calculateChecksum(ss58_bytes, checksum_length);
      ss58_bytes.put(checksum);
      return libp2p::multi::detail::encodeBase58(ss58_bytes.asVector());
    }

    SL_DEBUG(logger_,
             "No SS58 checksum fits {}-byte account with {}-byte prefix",
             account.size(),
             prefix.size());
    return Ss58Error::INVALID_LENGTH;
  }

}  // namespace subcodec::primitives
