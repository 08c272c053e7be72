/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

#include <gmock/gmock.h>

namespace subcodec::crypto {
  class HasherMock : public Hasher {
   public:
    ~HasherMock() override = default;

    MOCK_METHOD(Hash512,
                blake2b_512,
                (common::BufferView),
                (const, override));
  };
}  // namespace subcodec::crypto
