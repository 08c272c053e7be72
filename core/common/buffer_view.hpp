/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <cstdint>
#include <span>
#include <string>

#include "common/hexutil.hpp"

namespace subcodec::common {

  /**
   * @brief Non-owning view over a contiguous sequence of bytes
   */
  class BufferView : public std::span<const uint8_t> {
   public:
    using span::span;

    BufferView() = default;

    BufferView(std::initializer_list<uint8_t> &&) = delete;

    BufferView(const span &other) : span(other) {}

    template <typename T>
      requires std::is_integral_v<std::decay_t<T>> and (sizeof(T) == 1)
    BufferView(std::span<T> other)
        : span(reinterpret_cast<const uint8_t *>(other.data()), other.size()) {}

    std::string toHex() const {
      return hex_lower(*this);
    }

    bool operator==(const BufferView &other) const {
      return std::equal(begin(), end(), other.begin(), other.end());
    }
  };

}  // namespace subcodec::common
