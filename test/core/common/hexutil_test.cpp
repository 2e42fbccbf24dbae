/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace blockforge::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding, with and without prefix
 */
TEST(Common, Hexutil_Hex) {
  Buffer bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length in mixed case
 * @when unhex
 * @then result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020fF"));
  std::vector<uint8_t> expected{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded strings of odd length or with non-hex letters
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  ASSERT_FALSE(unhex("0"));
  ASSERT_FALSE(unhex("keks"));
}

/**
 * @given Hexencoded strings with and without the 0x prefix
 * @when unhex expecting a prefix, and unhex accepting either form
 * @then the prefix is required only where expected
 */
TEST(Common, Hexutil_UnhexPrefix) {
  EXPECT_OUTCOME_TRUE(with_prefix, unhexWith0x("0x0aff"));
  ASSERT_EQ(with_prefix, (std::vector<uint8_t>{0x0a, 0xff}));
  ASSERT_FALSE(unhexWith0x("0aff"));

  EXPECT_OUTCOME_TRUE(maybe_prefixed, unhexMaybe0x("0x0aff"));
  EXPECT_OUTCOME_TRUE(maybe_plain, unhexMaybe0x("0aff"));
  ASSERT_EQ(maybe_prefixed, maybe_plain);
  ASSERT_FALSE(unhexMaybe0x("0xzz"));
}
