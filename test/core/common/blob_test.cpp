/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace subcodec::common;

/**
 * @given hex string
 * @when create blob object from this string using fromHex method
 * @then blob object is created and contains expected byte representation of the
 * hex string
 */
TEST(BlobTest, CreateFromValidHex) {
  std::array<byte_t, 2> expected{0, 255};

  EXPECT_OUTCOME_TRUE(blob, Blob<2>::fromHex("00ff"));
  EXPECT_EQ(blob, expected);
}

/**
 * @given non hex string or hex of wrong length
 * @when try to create a Blob using fromHex on that string
 * @then error is returned
 */
TEST(BlobTest, CreateFromInvalidHex) {
  EXPECT_EC(Blob<2>::fromHex("nothex"), UnhexError::NON_HEX_INPUT);
  EXPECT_EC(Blob<2>::fromHex("0a1"), UnhexError::NOT_ENOUGH_INPUT);
  EXPECT_EC(Blob<2>::fromHex("00ff00"), BlobError::INCORRECT_LENGTH);
}

/**
 * @given 0x-prefixed hex of 20 bytes
 * @when create address from it
 * @then address holds the bytes in the same order
 */
TEST(BlobTest, Address20FromHexWithPrefix) {
  EXPECT_OUTCOME_TRUE(
      address,
      Address20::fromHexWithPrefix(
          "0x00112233445566778899aabbccddeeff00112233"));
  EXPECT_EQ(address[0], 0x00);
  EXPECT_EQ(address[1], 0x11);
  EXPECT_EQ(address[19], 0x33);
  EXPECT_EQ(address.toHex(), "00112233445566778899aabbccddeeff00112233");

  EXPECT_EC(Address20::fromHexWithPrefix("0x0011"),
            BlobError::INCORRECT_LENGTH);
}
