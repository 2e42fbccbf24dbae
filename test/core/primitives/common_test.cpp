/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/common.hpp"

#include <gtest/gtest.h>

using blockforge::primitives::formatEther;
using blockforge::primitives::saturatingToU64;
using blockforge::primitives::U256;

/**
 * @given wei amounts
 * @when formatting them as ether
 * @then all 18 decimals are printed
 */
TEST(PrimitivesCommonTest, FormatEther) {
  EXPECT_EQ(formatEther(0), "0.000000000000000000");
  EXPECT_EQ(formatEther(1), "0.000000000000000001");
  EXPECT_EQ(formatEther(U256{"1500000000000000000"}), "1.500000000000000000");
  EXPECT_EQ(formatEther(U256{"12000000000000000000"}),
            "12.000000000000000000");
}

/**
 * @given values below, at and above the 64 bit range
 * @when narrowing them
 * @then values that do not fit saturate
 */
TEST(PrimitivesCommonTest, SaturatingToU64) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  EXPECT_EQ(saturatingToU64(42), uint64_t{42});
  EXPECT_EQ(saturatingToU64(U256{kMax}), kMax);
  EXPECT_EQ(saturatingToU64(U256{kMax} + 1), kMax);
}
