/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include <boost/multiprecision/cpp_int.hpp>

#include "common/blob.hpp"

BLOCKFORGE_BLOB_STRICT_TYPEDEF(blockforge::primitives, Address, 20);

namespace blockforge::primitives {

  using common::Hash256;

  /// 256-bit unsigned integer for balances, fees and values (wei)
  using U256 = boost::multiprecision::uint256_t;

  using BlockNumber = uint64_t;
  using ChainId = uint64_t;
  using Nonce = uint64_t;
  using Gas = uint64_t;
  /// Seconds since unix epoch
  using Timestamp = uint64_t;

  /**
   * Renders a wei amount as ether with all 18 decimals, e.g.
   * 1 wei -> "0.000000000000000001"
   */
  std::string formatEther(const U256 &wei);

  /**
   * Converts to uint64_t, saturating at the maximum value
   */
  uint64_t saturatingToU64(const U256 &value);

}  // namespace blockforge::primitives
