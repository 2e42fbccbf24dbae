/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak.hpp"

#include <nettle/sha3.h>

namespace blockforge::crypto {

  namespace {
    // rate of the sponge for 256-bit output: 1600 - 2 * 256 bits
    constexpr size_t kRateBytes = 136;
    // keccak padding differs from FIPS-202 SHA3 only in the domain byte
    constexpr uint8_t kKeccakDomainPad = 0x01;
    constexpr uint8_t kFinalBitPad = 0x80;

    void xorByte(sha3_state &state, size_t index, uint8_t byte) {
      state.a[index / 8] ^= static_cast<uint64_t>(byte) << (8 * (index % 8));
    }

    uint8_t lanesByte(const sha3_state &state, size_t index) {
      return static_cast<uint8_t>(state.a[index / 8] >> (8 * (index % 8)));
    }
  }  // namespace

  common::Hash256 keccak256(common::BufferView data) {
    sha3_state state{};

    while (data.size() >= kRateBytes) {
      for (size_t i = 0; i < kRateBytes; ++i) {
        xorByte(state, i, data[i]);
      }
      sha3_permute(&state);
      data = data.subspan(kRateBytes);
    }

    for (size_t i = 0; i < data.size(); ++i) {
      xorByte(state, i, data[i]);
    }
    xorByte(state, data.size(), kKeccakDomainPad);
    xorByte(state, kRateBytes - 1, kFinalBitPad);
    sha3_permute(&state);

    common::Hash256 out;
    for (size_t i = 0; i < out.size(); ++i) {
      out[i] = lanesByte(state, i);
    }
    return out;
  }

}  // namespace blockforge::crypto
