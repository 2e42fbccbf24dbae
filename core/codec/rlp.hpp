/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/buffer.hpp"
#include "primitives/common.hpp"

/**
 * Recursive length prefix encoding of the values needed to sign and hash
 * transactions
 */
namespace blockforge::codec::rlp {

  constexpr uint8_t kShortStringOffset = 0x80;
  constexpr uint8_t kShortListOffset = 0xc0;
  constexpr size_t kShortPayloadLimit = 55;

  /// Big-endian representation without leading zero bytes, empty for zero
  common::Buffer toCompactBigEndian(const primitives::U256 &value);

  common::Buffer encodeBytes(common::BufferView bytes);

  common::Buffer encodeUint(const primitives::U256 &value);

  common::Buffer encodeUint(uint64_t value);

  /**
   * Wraps already encoded items into a list
   * @param items rlp encoded elements
   */
  common::Buffer encodeList(const std::vector<common::Buffer> &items);

}  // namespace blockforge::codec::rlp
