/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "scale/primitive_encoder.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using subcodec::common::Address20;
using subcodec::common::Buffer;
using subcodec::scale::BigUint;
using subcodec::scale::encodeFixedAddress;
using subcodec::scale::encodeOptional;
using subcodec::scale::encodeOptionalFixedAddress;
using subcodec::scale::encodeString;
using subcodec::scale::encodeUnsigned;
using subcodec::scale::PrimitiveEncodeError;
using subcodec::scale::UintWidth;

struct UnsignedEncodeTest
    : public testing::TestWithParam<std::tuple<BigUint, UintWidth, Buffer>> {
};

/**
 * @given value fitting the width
 * @when encode it
 * @then exactly width / 8 little-endian bytes are produced
 */
TEST_P(UnsignedEncodeTest, EncodesLittleEndian) {
  auto &[value, width, expected] = GetParam();
  EXPECT_OUTCOME_TRUE(encoded, encodeUnsigned(value, width));
  EXPECT_EQ(encoded.size(), static_cast<size_t>(width) / 8);
  EXPECT_EQ(encoded, expected);
}

INSTANTIATE_TEST_SUITE_P(
    UnsignedEncodeTestCases,
    UnsignedEncodeTest,
    testing::Values(
        std::tuple{BigUint{0}, UintWidth::U32, "00000000"_hex2buf},
        std::tuple{BigUint{1}, UintWidth::U32, "01000000"_hex2buf},
        std::tuple{BigUint{0x12345678}, UintWidth::U32, "78563412"_hex2buf},
        std::tuple{BigUint{0xFFFFFFFFu}, UintWidth::U32, "ffffffff"_hex2buf},
        std::tuple{BigUint{1}, UintWidth::U64, "0100000000000000"_hex2buf},
        std::tuple{BigUint{"0x0102030405060708"},
                   UintWidth::U64,
                   "0807060504030201"_hex2buf},
        std::tuple{BigUint{42},
                   UintWidth::U128,
                   "2a000000000000000000000000000000"_hex2buf},
        std::tuple{BigUint{(BigUint{1} << 128) - 1},
                   UintWidth::U128,
                   "ffffffffffffffffffffffffffffffff"_hex2buf},
        std::tuple{BigUint{"0x0f0e0d0c0b0a09080706050403020100"},
                   UintWidth::U128,
                   "000102030405060708090a0b0c0d0e0f"_hex2buf}));

/**
 * @given values one above the maximum of each width
 * @when encode them
 * @then value too large is reported, nothing is truncated
 */
TEST(PrimitiveEncoder, UnsignedOverflow) {
  EXPECT_EC(encodeUnsigned(BigUint{1} << 32, UintWidth::U32),
            PrimitiveEncodeError::VALUE_TOO_LARGE);
  EXPECT_EC(encodeUnsigned(BigUint{1} << 64, UintWidth::U64),
            PrimitiveEncodeError::VALUE_TOO_LARGE);
  EXPECT_EC(encodeUnsigned(BigUint{1} << 128, UintWidth::U128),
            PrimitiveEncodeError::VALUE_TOO_LARGE);
}

/**
 * @given negative value
 * @when encode it as unsigned
 * @then error is returned instead of wrapped bytes
 */
TEST(PrimitiveEncoder, NegativeValue) {
  EXPECT_EC(encodeUnsigned(BigUint{-1}, UintWidth::U64),
            PrimitiveEncodeError::NEGATIVE_VALUE);
}

TEST(PrimitiveEncoder, UnsupportedWidth) {
  EXPECT_EC(encodeUnsigned(BigUint{1}, static_cast<UintWidth>(16)),
            PrimitiveEncodeError::UNSUPPORTED_WIDTH);
}

/**
 * @given strings up to 63 bytes
 * @when encode them
 * @then single compact length byte is followed by the string bytes
 */
TEST(PrimitiveEncoder, String) {
  EXPECT_OUTCOME_TRUE(empty, encodeString(""));
  EXPECT_EQ(empty, "00"_hex2buf);

  EXPECT_OUTCOME_TRUE(abc, encodeString("abc"));
  EXPECT_EQ(abc, "0c616263"_hex2buf);

  // length is counted in UTF-8 bytes
  EXPECT_OUTCOME_TRUE(utf8, encodeString("\xd0\xb9"));
  EXPECT_EQ(utf8, "08d0b9"_hex2buf);

  std::string longest(63, 'x');
  EXPECT_OUTCOME_TRUE(encoded, encodeString(longest));
  ASSERT_EQ(encoded.size(), 64);
  EXPECT_EQ(encoded[0], 63 << 2);
  EXPECT_EQ(Buffer(encoded.view().subspan(1)), Buffer{}.put(longest));
}

/**
 * @given string of 64 bytes
 * @when encode it
 * @then error is returned
 */
TEST(PrimitiveEncoder, StringTooLong) {
  EXPECT_EC(encodeString(std::string(64, 'x')),
            PrimitiveEncodeError::STRING_TOO_LONG);
}

TEST(PrimitiveEncoder, FixedAddress) {
  auto address = "0x000102030405060708090a0b0c0d0e0f10111213"_address20;
  EXPECT_EQ(encodeFixedAddress(address),
            "000102030405060708090a0b0c0d0e0f10111213"_hex2buf);
}

/**
 * @given absent and present addresses
 * @when encode them as Option
 * @then None is a single zero byte, Some is 0x01 followed by 20 bytes
 */
TEST(PrimitiveEncoder, OptionalFixedAddress) {
  EXPECT_EQ(encodeOptionalFixedAddress(std::nullopt), "00"_hex2buf);

  auto address = "0xffffffffffffffffffffffffffffffffffffffff"_address20;
  auto encoded = encodeOptionalFixedAddress(address);
  ASSERT_EQ(encoded.size(), 21);
  EXPECT_EQ(encoded, "01ffffffffffffffffffffffffffffffffffffffff"_hex2buf);
}

/**
 * @given inner encoders returning either value or result
 * @when encode Option over them
 * @then tag byte is prepended, inner error is propagated unchanged
 */
TEST(PrimitiveEncoder, OptionalGeneric) {
  auto u32 = [](const BigUint &v) {
    return encodeUnsigned(v, UintWidth::U32);
  };

  EXPECT_OUTCOME_TRUE(none, encodeOptional(std::optional<BigUint>{}, u32));
  EXPECT_EQ(none, "00"_hex2buf);

  EXPECT_OUTCOME_TRUE(some,
                      encodeOptional(std::optional<BigUint>{BigUint{7}}, u32));
  EXPECT_EQ(some, "0107000000"_hex2buf);

  EXPECT_EC(encodeOptional(std::optional<BigUint>{BigUint{1} << 40}, u32),
            PrimitiveEncodeError::VALUE_TOO_LARGE);

  std::optional<Address20> zero_address{Address20{}};
  EXPECT_OUTCOME_TRUE(plain, encodeOptional(zero_address, encodeFixedAddress));
  EXPECT_EQ(plain.size(), 21);
}
