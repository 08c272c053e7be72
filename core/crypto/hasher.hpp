/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace subcodec::crypto {
  class Hasher {
   protected:
    using Hash512 = common::Hash512;

   public:
    virtual ~Hasher() = default;

    /**
     * @brief blake2b_512 function calculates 64-byte unkeyed blake2b hash
     * @param data source value
     * @return 512-bit hash value
     */
    virtual Hash512 blake2b_512(common::BufferView data) const = 0;
  };
}  // namespace subcodec::crypto
