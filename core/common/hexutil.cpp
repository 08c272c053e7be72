/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <iterator>

#include "common/buffer_view.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subcodec::common, UnhexError, e) {
  using subcodec::common::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains odd number of characters";
    case UnhexError::MISSING_0X_PREFIX:
      return "Missing expected 0x prefix";
    case UnhexError::UNKNOWN:
      return "Unknown error";
  }
  return "Unknown error (error id not listed)";
}

namespace subcodec::common {

  namespace {
    constexpr std::string_view kHexPrefix = "0x";
  }

  std::string hex_lower(BufferView bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower_0x(BufferView bytes) {
    std::string res{kHexPrefix};
    res.reserve(kHexPrefix.size() + bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> blob;
    blob.reserve((hex.size() + 1) / 2);
    OUTCOME_TRY(unhex_to(hex, std::back_inserter(blob)));
    return blob;
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(
      std::string_view hex_with_prefix) {
    if (not hex_with_prefix.starts_with(kHexPrefix)) {
      return UnhexError::MISSING_0X_PREFIX;
    }
    return unhex(hex_with_prefix.substr(kHexPrefix.size()));
  }

  outcome::result<std::vector<uint8_t>> unhexMaybe0x(std::string_view hex) {
    if (hex.starts_with(kHexPrefix)) {
      return unhexWith0x(hex);
    }
    return unhex(hex);
  }

}  // namespace subcodec::common
