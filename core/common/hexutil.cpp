/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <qtils/hex.hpp>
#include <qtils/unhex.hpp>

namespace blockforge::common {

  std::string hex_lower(BufferView bytes) {
    return fmt::format("{:x}", std::span{bytes});
  }

  std::string hex_lower_0x(BufferView bytes) {
    return fmt::format("{:0x}", std::span{bytes});
  }

  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    return qtils::unhex(hex);
  }

  outcome::result<std::vector<uint8_t>> unhexWith0x(
      std::string_view hex_with_prefix) {
    return qtils::unhex0x(hex_with_prefix);
  }

  outcome::result<std::vector<uint8_t>> unhexMaybe0x(std::string_view hex) {
    if (hex.starts_with("0x")) {
      return unhexWith0x(hex);
    }
    return unhex(hex);
  }

}  // namespace blockforge::common
