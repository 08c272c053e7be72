/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "scale/fixed_integers.hpp"

namespace subcodec::scale {

  enum class PrimitiveEncodeError {
    VALUE_TOO_LARGE = 1,
    NEGATIVE_VALUE,
    UNSUPPORTED_WIDTH,
    STRING_TOO_LONG,
  };

  /// Wire widths of fixed-size unsigned integers
  enum class UintWidth : uint8_t { U32 = 32, U64 = 64, U128 = 128 };

  /// Tag bytes of an encoded Option<T>
  constexpr uint8_t kOptionalNone = 0x00;
  constexpr uint8_t kOptionalSome = 0x01;

  /// Largest length which fits single-byte compact mode
  constexpr size_t kMaxSingleByteCompact = 0b0011'1111;

  /**
   * Narrows {@param value} into a fixed-width little-endian integer.
   * Values which don't fit {@param width} are rejected, never truncated.
   */
  outcome::result<common::Buffer> encodeUnsigned(const BigUint &value,
                                                 UintWidth width);

  /**
   * Encodes a string as its compact byte length followed by UTF-8 bytes.
   * Only single-byte compact lengths (up to 63 bytes) are accepted.
   */
  outcome::result<common::Buffer> encodeString(std::string_view text);

  common::Buffer encodeFixedAddress(const common::Address20 &address);

  /**
   * Encodes Option<T>: 0x00 when absent, otherwise 0x01 followed by the
   * output of {@param inner}. The inner encoder may return either a buffer or
   * a result; its error is propagated.
   */
  template <typename T, typename Encoder>
  outcome::result<common::Buffer> encodeOptional(const std::optional<T> &value,
                                                 Encoder &&inner) {
    if (not value.has_value()) {
      return common::Buffer{kOptionalNone};
    }
    OUTCOME_TRY(encoded, outcome::into(inner(*value)));
    common::Buffer out;
    out.reserve(encoded.size() + 1).putUint8(kOptionalSome).put(encoded);
    return out;
  }

  common::Buffer encodeOptionalFixedAddress(
      const std::optional<common::Address20> &address);

}  // namespace subcodec::scale

OUTCOME_HPP_DECLARE_ERROR(subcodec::scale, PrimitiveEncodeError);
