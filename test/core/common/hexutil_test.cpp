/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "common/buffer_view.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using namespace subcodec::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected encoding
 */
TEST(Common, Hexutil_Hex) {
  auto bin = "00010204081020FF"_unhex;
  EXPECT_EQ(hex_lower(bin), "00010204081020ff"s);
  EXPECT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
  EXPECT_EQ(hex_lower(BufferView{}), ""s);
}

/**
 * @given Hexencoded string of even length
 * @when unhex
 * @then no exception, result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020ff"));
  EXPECT_EQ(actual, (std::vector<uint8_t>{0, 1, 2, 4, 8, 16, 32, 255}));
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given Hexencoded string with and without 0x prefix
 * @when unhex with and without prefix requirement
 * @then prefix is required only by unhexWith0x
 */
TEST(Common, Hexutil_Prefix) {
  EXPECT_OUTCOME_TRUE(with_prefix, unhexWith0x("0x0aff"));
  EXPECT_EQ(with_prefix, (std::vector<uint8_t>{0x0a, 0xff}));

  EXPECT_EC(unhexWith0x("0aff"), UnhexError::MISSING_0X_PREFIX);

  EXPECT_OUTCOME_TRUE(maybe_with, unhexMaybe0x("0x0aff"));
  EXPECT_OUTCOME_TRUE(maybe_without, unhexMaybe0x("0AFF"));
  EXPECT_EQ(maybe_with, maybe_without);
}
