/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/rlp.hpp"

#include <iterator>

namespace blockforge::codec::rlp {

  namespace {
    common::Buffer encodeLength(size_t length, uint8_t offset) {
      if (length <= kShortPayloadLimit) {
        return {static_cast<uint8_t>(offset + length)};
      }
      auto length_bytes = toCompactBigEndian(primitives::U256{length});
      // long form: offset + 55 + size of the length, then the length itself
      common::Buffer out{static_cast<uint8_t>(offset + kShortPayloadLimit
                                              + length_bytes.size())};
      out.insert(out.end(), length_bytes.begin(), length_bytes.end());
      return out;
    }
  }  // namespace

  common::Buffer toCompactBigEndian(const primitives::U256 &value) {
    common::Buffer out;
    if (value == 0) {
      return out;
    }
    boost::multiprecision::export_bits(value, std::back_inserter(out), 8);
    return out;
  }

  common::Buffer encodeBytes(common::BufferView bytes) {
    if (bytes.size() == 1 and bytes[0] < kShortStringOffset) {
      return {bytes[0]};
    }
    auto out = encodeLength(bytes.size(), kShortStringOffset);
    out.insert(out.end(), bytes.begin(), bytes.end());
    return out;
  }

  common::Buffer encodeUint(const primitives::U256 &value) {
    return encodeBytes(toCompactBigEndian(value));
  }

  common::Buffer encodeUint(uint64_t value) {
    return encodeUint(primitives::U256{value});
  }

  common::Buffer encodeList(const std::vector<common::Buffer> &items) {
    size_t payload_size = 0;
    for (const auto &item : items) {
      payload_size += item.size();
    }
    auto out = encodeLength(payload_size, kShortListOffset);
    out.reserve(out.size() + payload_size);
    for (const auto &item : items) {
      out.insert(out.end(), item.begin(), item.end());
    }
    return out;
  }

}  // namespace blockforge::codec::rlp
