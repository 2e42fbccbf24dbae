/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/common.hpp"

#include <limits>

namespace blockforge::primitives {

  namespace {
    constexpr size_t kEtherDecimals = 18;
  }

  std::string formatEther(const U256 &wei) {
    static const U256 kWeiPerEther{"1000000000000000000"};
    auto integral = (wei / kWeiPerEther).str();
    auto fractional = (wei % kWeiPerEther).str();
    return integral + "."
         + std::string(kEtherDecimals - fractional.size(), '0') + fractional;
  }

  uint64_t saturatingToU64(const U256 &value) {
    constexpr auto kMax = std::numeric_limits<uint64_t>::max();
    if (value > kMax) {
      return kMax;
    }
    return value.convert_to<uint64_t>();
  }

}  // namespace blockforge::primitives
