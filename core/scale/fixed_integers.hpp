/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>

#include <boost/multiprecision/cpp_int.hpp>
#include <scale/scale.hpp>

#include "common/buffer.hpp"

namespace subcodec::scale {

  /// Unbounded unsigned value as supplied by the caller
  using BigUint = boost::multiprecision::cpp_int;

  using uint128_t = boost::multiprecision::checked_uint128_t;

  template <typename T>
  concept SupportedInteger = std::is_unsigned_v<T>  //
                          or std::is_same_v<T, uint128_t>;

  template <SupportedInteger T>
  struct IntegerTraits {
    static constexpr size_t kBitSize = sizeof(T) * 8;
  };
  template <>
  struct IntegerTraits<uint128_t> {
    static constexpr size_t kBitSize = 128;
  };

  template <typename To, typename From>
    requires std::is_trivial_v<From>
  To convert_to(From t) {
    return static_cast<To>(t);
  }

  template <typename To, typename From>
    requires boost::multiprecision::is_number<From>::value
  To convert_to(const From &t) {
    return t.template convert_to<To>();
  }

  /**
   * Encodes {@param value} as exactly IntegerTraits<T>::kBitSize / 8
   * little-endian bytes
   */
  template <SupportedInteger T>
  common::Buffer encodeFixed(const T &value) {
    ::scale::ScaleEncoderStream s;
    if constexpr (std::is_integral_v<T>) {
      s << value;
    } else {
      for (size_t i = 0; i < IntegerTraits<T>::kBitSize; i += 8) {
        const T byte = (value >> i) & 0xFFu;
        s << convert_to<uint8_t>(byte);
      }
    }
    return common::Buffer{s.to_vector()};
  }

}  // namespace subcodec::scale
