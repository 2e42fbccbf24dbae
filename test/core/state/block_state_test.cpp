/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state/block_state.hpp"

#include <gtest/gtest.h>

#include "mock/core/state/state_provider_mock.hpp"
#include "state/state_provider_error.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using blockforge::primitives::U256;
using blockforge::state::AccountInfo;
using blockforge::state::BlockState;
using blockforge::state::CachedReads;
using blockforge::state::StateProviderError;
using blockforge::state::StateProviderMock;
using testing::_;
using testing::Return;
using namespace testutil::literals;

class BlockStateTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  const blockforge::primitives::Address alice_ =
      "0x00000000000000000000000000000000000000a1"_address;
  const blockforge::primitives::Address bob_ =
      "0x00000000000000000000000000000000000000b0"_address;
  std::shared_ptr<StateProviderMock> provider_ =
      std::make_shared<StateProviderMock>();
};

/**
 * @given a state view with an empty cache
 * @when reading the same account twice
 * @then the snapshot is queried once and the answer lands in the cache
 */
TEST_F(BlockStateTest, ReadThroughPopulatesCache) {
  EXPECT_CALL(*provider_, basicAccount(alice_))
      .WillOnce(Return(std::make_optional(AccountInfo{.balance = 10,
                                                      .nonce = 4})));
  BlockState state{provider_, CachedReads{}};

  EXPECT_OUTCOME_TRUE(balance, state.balance(alice_));
  EXPECT_EQ(balance, 10);
  EXPECT_OUTCOME_TRUE(nonce, state.nonce(alice_));
  EXPECT_EQ(nonce, 4);

  ASSERT_NE(state.cachedReads().account(alice_), nullptr);
  EXPECT_EQ(state.cachedReads().size(), 1);
}

/**
 * @given a state view seeded with cached reads
 * @when reading a cached account
 * @then the snapshot is not queried
 */
TEST_F(BlockStateTest, SeededCacheAnswersReads) {
  EXPECT_CALL(*provider_, basicAccount(_)).Times(0);
  CachedReads reads;
  reads.insertAccount(alice_, AccountInfo{.balance = 7, .nonce = 1});
  reads.insertAccount(bob_, std::nullopt);
  BlockState state{provider_, std::move(reads)};

  EXPECT_OUTCOME_TRUE(balance, state.balance(alice_));
  EXPECT_EQ(balance, 7);
  EXPECT_OUTCOME_TRUE(missing_balance, state.balance(bob_));
  EXPECT_EQ(missing_balance, 0);
}

/**
 * @given a state view
 * @when modifying balances and nonces
 * @then reads observe the changes while the cache keeps pre-state values
 */
TEST_F(BlockStateTest, WritesStayOutOfCache) {
  EXPECT_CALL(*provider_, basicAccount(alice_))
      .WillOnce(Return(std::make_optional(AccountInfo{.balance = 10})));
  EXPECT_CALL(*provider_, basicAccount(bob_))
      .WillOnce(Return(std::optional<AccountInfo>{}));
  BlockState state{provider_, CachedReads{}};

  EXPECT_OUTCOME_TRUE_1(state.incrementBalance(alice_, 5));
  EXPECT_OUTCOME_TRUE_1(state.setNonce(alice_, 2));
  EXPECT_OUTCOME_TRUE_1(state.setBalance(bob_, 3));

  EXPECT_OUTCOME_TRUE(alice_balance, state.balance(alice_));
  EXPECT_EQ(alice_balance, 15);
  EXPECT_OUTCOME_TRUE(alice_nonce, state.nonce(alice_));
  EXPECT_EQ(alice_nonce, 2);
  EXPECT_OUTCOME_TRUE(bob_balance, state.balance(bob_));
  EXPECT_EQ(bob_balance, 3);

  auto reads = state.takeCachedReads();
  EXPECT_EQ((*reads.account(alice_))->balance, 10);
  EXPECT_FALSE(reads.account(bob_)->has_value());
  EXPECT_TRUE(state.cachedReads().empty());
}

/**
 * @given storage reads and writes
 * @when reading slots
 * @then missing slots read as zero, are cached, and writes shadow them
 */
TEST_F(BlockStateTest, StorageReadThrough) {
  EXPECT_CALL(*provider_, storage(alice_, "slot"_hash256))
      .WillOnce(Return(std::optional<U256>{}));
  BlockState state{provider_, CachedReads{}};

  EXPECT_OUTCOME_TRUE(value, state.storage(alice_, "slot"_hash256));
  EXPECT_EQ(value, 0);
  state.setStorage(alice_, "slot"_hash256, 8);
  EXPECT_OUTCOME_TRUE(written, state.storage(alice_, "slot"_hash256));
  EXPECT_EQ(written, 8);
  EXPECT_EQ(state.cachedReads().storage(alice_, "slot"_hash256), U256{0});
}

/**
 * @given a snapshot failing with a database error
 * @when reading an account
 * @then the error is propagated and nothing is cached
 */
TEST_F(BlockStateTest, ProviderErrorPropagates) {
  EXPECT_CALL(*provider_, basicAccount(alice_))
      .WillOnce(Return(StateProviderError::DATABASE_FAILURE));
  BlockState state{provider_, CachedReads{}};

  EXPECT_EC(state.balance(alice_), StateProviderError::DATABASE_FAILURE);
  EXPECT_TRUE(state.cachedReads().empty());
}
