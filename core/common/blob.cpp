/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subcodec::common, BlobError, e) {
  using subcodec::common::BlobError;

  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input string has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace subcodec::common {

  // explicit instantiations for the blobs used across the codec
  template class Blob<20ul>;
  template class Blob<64ul>;

}  // namespace subcodec::common
