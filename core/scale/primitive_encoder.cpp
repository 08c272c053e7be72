/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scale/primitive_encoder.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subcodec::scale, PrimitiveEncodeError, e) {
  using E = subcodec::scale::PrimitiveEncodeError;
  switch (e) {
    case E::VALUE_TOO_LARGE:
      return "Value is too large for the target integer width";
    case E::NEGATIVE_VALUE:
      return "Negative value can't be encoded as unsigned integer";
    case E::UNSUPPORTED_WIDTH:
      return "Unsupported integer width";
    case E::STRING_TOO_LONG:
      return "String is too long for single-byte compact length";
  }
  return "Unknown primitive encoder error";
}

namespace subcodec::scale {

  namespace {
    BigUint maxValueOf(UintWidth width) {
      return (BigUint{1} << static_cast<unsigned>(width)) - 1;
    }
  }  // namespace

  outcome::result<common::Buffer> encodeUnsigned(const BigUint &value,
                                                 UintWidth width) {
    if (value.sign() < 0) {
      return PrimitiveEncodeError::NEGATIVE_VALUE;
    }
    switch (width) {
      case UintWidth::U32:
      case UintWidth::U64:
      case UintWidth::U128:
        break;
      default:
        return PrimitiveEncodeError::UNSUPPORTED_WIDTH;
    }
    if (value > maxValueOf(width)) {
      return PrimitiveEncodeError::VALUE_TOO_LARGE;
    }

    switch (width) {
      case UintWidth::U32:
        return encodeFixed(static_cast<uint32_t>(value));
      case UintWidth::U64:
        return encodeFixed(static_cast<uint64_t>(value));
      case UintWidth::U128:
        return encodeFixed(static_cast<uint128_t>(value));
    }
    return PrimitiveEncodeError::UNSUPPORTED_WIDTH;
  }

  outcome::result<common::Buffer> encodeString(std::string_view text) {
    if (text.size() > kMaxSingleByteCompact) {
      return PrimitiveEncodeError::STRING_TOO_LONG;
    }
    ::scale::ScaleEncoderStream s;
    s << ::scale::CompactInteger{text.size()};
    common::Buffer out{s.to_vector()};
    out.put(text);
    return out;
  }

  common::Buffer encodeFixedAddress(const common::Address20 &address) {
    return common::Buffer{address};
  }

  common::Buffer encodeOptionalFixedAddress(
      const std::optional<common::Address20> &address) {
    common::Buffer out;
    if (not address.has_value()) {
      return out.putUint8(kOptionalNone);
    }
    out.reserve(common::Address20::size() + 1)
        .putUint8(kOptionalSome)
        .put(encodeFixedAddress(*address));
    return out;
  }

}  // namespace subcodec::scale
