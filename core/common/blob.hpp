/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <ostream>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

namespace subcodec::common {

  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { INCORRECT_LENGTH = 1 };

  using byte_t = uint8_t;

  /**
   * Base type which represents blob of fixed size.
   *
   * std::string is convenient to use but it is not safe.
   * We can not specify the fixed length for string.
   *
   * For std::array it is possible, so we prefer it over std::string.
   */
  template <size_t size_>
  class Blob : public std::array<byte_t, size_> {
    using Array = std::array<byte_t, size_>;

   public:
    /**
     * Initialize blob value
     */
    constexpr Blob() : Array{} {}

    /**
     * @brief constructor enabling initializer list
     * @param l initializer list
     */
    constexpr explicit Blob(const Array &l) : Array{l} {}

    /**
     * In compile-time returns size of current blob.
     */
    static constexpr size_t size() {
      return size_;
    }

    /**
     * Converts current blob to hex string.
     */
    std::string toHex() const {
      return hex_lower({this->data(), size_});
    }

    /**
     * Create Blob from hex string
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * is in hex format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from hex string prefixed with 0x
     */
    static outcome::result<Blob<size_>> fromHexWithPrefix(
        std::string_view hex) {
      OUTCOME_TRY(res, unhexWith0x(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from BufferView
     */
    static outcome::result<Blob<size_>> fromSpan(const BufferView &span) {
      if (span.size() != size_) {
        return BlobError::INCORRECT_LENGTH;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  extern template class Blob<20ul>;
  extern template class Blob<64ul>;

  using Hash512 = Blob<64>;

  /// Fixed-width account address of the sending chain (H160)
  using Address20 = Blob<20>;

  template <size_t N>
  inline std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace subcodec::common

OUTCOME_HPP_DECLARE_ERROR(subcodec::common, BlobError);
