/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace blockforge::crypto {

  /**
   * Keccak-256 with the pre-FIPS padding as used by ethereum for
   * transaction hashes, signing digests and address derivation
   */
  common::Hash256 keccak256(common::BufferView data);

}  // namespace blockforge::crypto
