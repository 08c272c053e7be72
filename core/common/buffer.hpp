/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <ostream>
#include <string_view>
#include <vector>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"
#include "outcome/outcome.hpp"

namespace subcodec::common {

  /**
   * @brief Class represents arbitrary (including empty) byte buffer.
   */
  class Buffer : public std::vector<uint8_t> {
   public:
    using Base = std::vector<uint8_t>;

    Buffer() = default;

    /**
     * @brief lvalue construct buffer from a byte vector
     */
    explicit Buffer(const Base &other) : Base(other) {}
    Buffer(Base &&other) : Base(std::move(other)) {}

    Buffer(std::initializer_list<uint8_t> list) : Base(list) {}

    Buffer(const BufferView &s) : Base(s.begin(), s.end()) {}

    template <size_t N>
    explicit Buffer(const std::array<uint8_t, N> &other)
        : Base(other.begin(), other.end()) {}

    Buffer(const uint8_t *begin, const uint8_t *end) : Base(begin, end) {}

    Buffer &reserve(size_t size) {
      Base::reserve(size);
      return *this;
    }

    /**
     * @brief Put a 8-bit {@param n} in this buffer.
     * @return this buffer, suitable for chaining.
     */
    Buffer &putUint8(uint8_t n) {
      Base::push_back(n);
      return *this;
    }

    /**
     * @brief Put a string into byte buffer
     * @param view arbitrary string
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(std::string_view view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    /**
     * @brief Put a sequence of bytes as view into byte buffer
     * @param view arbitrary span of bytes
     * @return this buffer, suitable for chaining.
     */
    Buffer &put(const BufferView &view) {
      Base::insert(Base::end(), view.begin(), view.end());
      return *this;
    }

    BufferView view() const {
      return {data(), size()};
    }

    /**
     * @brief getter for vector of bytes
     */
    const std::vector<uint8_t> &asVector() const {
      return static_cast<const Base &>(*this);
    }

    std::vector<uint8_t> &asVector() {
      return static_cast<Base &>(*this);
    }

    /**
     * @brief encode bytearray as hex
     * @return hex-encoded string
     */
    std::string toHex() const {
      return hex_lower(view());
    }

    /**
     * @brief Construct Buffer from hex string, 0x prefix is not accepted
     * @param hex hex-encoded string
     * @return result containing constructed buffer if input string is
     * hex-encoded string.
     */
    static outcome::result<Buffer> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return Buffer{std::move(bytes)};
    }
  };

  inline std::ostream &operator<<(std::ostream &os, const Buffer &buffer) {
    return os << buffer.toHex();
  }

}  // namespace subcodec::common
