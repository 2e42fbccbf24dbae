/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state/cached_reads.hpp"

#include <gtest/gtest.h>

#include "testutil/literals.hpp"

using blockforge::state::AccountInfo;
using blockforge::state::CachedReads;
using namespace testutil::literals;

namespace {
  const auto kAlice = "0x00000000000000000000000000000000000000a1"_address;
  const auto kBob = "0x00000000000000000000000000000000000000b0"_address;
}  // namespace

/**
 * @given an empty cache
 * @when inserting an existing and a missing account and a storage slot
 * @then lookups distinguish unknown, missing and existing entries
 */
TEST(CachedReadsTest, InsertAndLookup) {
  CachedReads reads;
  EXPECT_TRUE(reads.empty());
  EXPECT_EQ(reads.account(kAlice), nullptr);

  reads.insertAccount(kAlice, AccountInfo{.balance = 5, .nonce = 1});
  reads.insertAccount(kBob, std::nullopt);
  reads.insertStorage(kAlice, "slot"_hash256, 9);

  ASSERT_NE(reads.account(kAlice), nullptr);
  ASSERT_TRUE(reads.account(kAlice)->has_value());
  EXPECT_EQ((*reads.account(kAlice))->balance, 5);
  ASSERT_NE(reads.account(kBob), nullptr);
  EXPECT_FALSE(reads.account(kBob)->has_value());
  EXPECT_EQ(reads.storage(kAlice, "slot"_hash256), 9);
  EXPECT_EQ(reads.storage(kBob, "slot"_hash256), std::nullopt);
  EXPECT_EQ(reads.size(), 3);
}
