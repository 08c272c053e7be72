/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iterator>

#include <boost/algorithm/hex.hpp>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace subcodec::common {

  class BufferView;

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
    MISSING_0X_PREFIX,
    UNKNOWN
  };
}  // namespace subcodec::common

OUTCOME_HPP_DECLARE_ERROR(subcodec::common, UnhexError);

namespace subcodec::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes source bytes
   * @return lowercase hexstring
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes source bytes
   * @return lowercase hexstring
   */
  std::string hex_lower_0x(BufferView bytes);

  template <std::output_iterator<uint8_t> Iter>
  outcome::result<void> unhex_to(std::string_view hex, Iter out) {
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), out);
      return outcome::success();

    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::NOT_ENOUGH_INPUT;

    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::NON_HEX_INPUT;

    } catch (const std::exception &e) {
      return UnhexError::UNKNOWN;
    }
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex hexstring, both uppercase and lowercase digits are accepted
   * @return result containing array of bytes if input string is hex encoded
   * and has even length
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Unhex hex-string with 0x in the beginning
   * @param hex hex string with 0x in the beginning
   * @return unhexed buffer
   */
  outcome::result<std::vector<uint8_t>> unhexWith0x(std::string_view hex);

  /**
   * @brief Unhex hex-string, the 0x prefix is optional
   */
  outcome::result<std::vector<uint8_t>> unhexMaybe0x(std::string_view hex);

}  // namespace subcodec::common
