/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include <boost/assert.hpp>
#include <openssl/evp.h>

namespace subcodec::crypto {
  using common::Hash512;

  Hash512 HasherImpl::blake2b_512(common::BufferView data) const {
    Hash512 out;
    unsigned int out_size = 0;
    BOOST_VERIFY(EVP_Digest(data.data(),
                            data.size(),
                            out.data(),
                            &out_size,
                            EVP_blake2b512(),
                            nullptr)
                 == 1);
    BOOST_ASSERT(out_size == Hash512::size());
    return out;
  }
}  // namespace subcodec::crypto
