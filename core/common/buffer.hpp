/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace blockforge::common {

  using byte_t = uint8_t;

  /// Owned byte sequence (encoded transactions, rlp payloads, blobs)
  using Buffer = std::vector<byte_t>;

  /// Non-owning view over contiguous bytes
  using BufferView = std::span<const byte_t>;

}  // namespace blockforge::common
