/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "application/filler_builder_config.hpp"
#include "building/root_hash_task_pool.hpp"
#include "execution/execution_error.hpp"
#include "mock/core/bidding/slot_bidder_mock.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "mock/core/execution/partial_block_factory_mock.hpp"
#include "mock/core/execution/partial_block_mock.hpp"
#include "mock/core/state/state_provider_factory_mock.hpp"
#include "mock/core/state/state_provider_mock.hpp"
#include "mock/core/telemetry/built_block_metrics_mock.hpp"
#include "state/block_state.hpp"
#include "testutil/literals.hpp"
#include "testutil/prepare_loggers.hpp"

namespace testutil {

  using blockforge::application::FillerBuilderConfig;
  using blockforge::bidding::SlotBidderMock;
  using blockforge::building::BlockBuildingContext;
  using blockforge::building::RootHashTaskPool;
  using blockforge::clock::SteadyClock;
  using blockforge::clock::SteadyClockMock;
  using blockforge::clock::SystemClock;
  using blockforge::clock::SystemClockMock;
  using blockforge::common::Hash256;
  using blockforge::crypto::Secp256k1Signer;
  using blockforge::execution::ExecutionError;
  using blockforge::execution::ExecutionResult;
  using blockforge::execution::FinalizedBlock;
  using blockforge::execution::PartialBlock;
  using blockforge::execution::PartialBlockFactoryMock;
  using blockforge::execution::PartialBlockMock;
  using blockforge::primitives::Address;
  using blockforge::primitives::Nonce;
  using blockforge::primitives::SignedTransaction;
  using blockforge::primitives::Timestamp;
  using blockforge::primitives::U256;
  using blockforge::state::AccountInfo;
  using blockforge::state::BlockState;
  using blockforge::state::StateProvider;
  using blockforge::state::StateProviderFactoryMock;
  using blockforge::state::StateProviderMock;
  using blockforge::telemetry::BuiltBlockMetricsMock;
  using testing::_;
  using testing::Invoke;
  using testing::NiceMock;
  using testing::Return;
  using namespace literals;

  /**
   * Environment of a filler build: the chain state is served by mocks and
   * partial blocks execute plain transfers, checking the sender nonce.
   */
  class FillerTestFixture : public testing::Test {
   public:
    static constexpr Nonce kFillerNonce = 3;
    static constexpr uint64_t kFeeRecipientBalance = 100;
    static constexpr blockforge::primitives::Gas kTransferGas = 21000;

    static void SetUpTestCase() {
      prepareLoggers();
    }

    void SetUp() override {
      config_.filler_tx_private_key =
          "0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318";
      config_.filler_tx_value = 1;

      ctx_.parent_hash = "parent"_hash256;
      ctx_.block_number = 100;
      ctx_.timestamp = 1700000000;
      ctx_.basefee = 7;
      ctx_.gas_limit = 30000000;
      ctx_.chain_id = 17000;
      ctx_.coinbase = builder_address_;
      ctx_.suggested_fee_recipient = fee_recipient_;
      ctx_.builder_signer = builder_address_;

      ON_CALL(*provider_factory_, checkHealth(_))
          .WillByDefault(Return(blockforge::outcome::success()));
      ON_CALL(*provider_factory_, historyByBlockHash(_))
          .WillByDefault(Return(std::shared_ptr<StateProvider>(state_provider_)));
      ON_CALL(*provider_factory_, lastBlockNumber())
          .WillByDefault(Return(blockforge::primitives::BlockNumber{105}));

      ON_CALL(*state_provider_, basicAccount(_))
          .WillByDefault(Invoke(
              [this](const Address &address)
                  -> blockforge::outcome::result<std::optional<AccountInfo>> {
                if (address == signer_.address()) {
                  return std::make_optional(AccountInfo{
                      .balance = U256{1000000000}, .nonce = kFillerNonce});
                }
                if (address == fee_recipient_) {
                  return std::make_optional(
                      AccountInfo{.balance = U256{kFeeRecipientBalance}});
                }
                return std::optional<AccountInfo>{};
              }));
      ON_CALL(*state_provider_, accountBalance(_))
          .WillByDefault(Invoke(
              [this](const Address &address)
                  -> blockforge::outcome::result<std::optional<U256>> {
                if (address == fee_recipient_) {
                  return std::make_optional(U256{kFeeRecipientBalance});
                }
                return std::optional<U256>{};
              }));

      ON_CALL(*partial_block_factory_, make(_))
          .WillByDefault(Invoke([this](const BlockBuildingContext &ctx) {
            made_contexts_.push_back(ctx);
            return makePartialBlock();
          }));

      ON_CALL(*steady_clock_, now()).WillByDefault(Invoke([this] {
        return steady_now_;
      }));
      ON_CALL(*system_clock_, now()).WillByDefault(Return(system_now_));

      ON_CALL(*slot_bidder_, sealBid(_, _))
          .WillByDefault(Invoke([](const U256 &profit, Timestamp) {
            return std::make_optional(profit);
          }));
    }

   protected:
    std::unique_ptr<PartialBlock> makePartialBlock() {
      committed_.clear();
      auto block = std::make_unique<NiceMock<PartialBlockMock>>();
      ON_CALL(*block, preBlockCall(_, _))
          .WillByDefault(Invoke([this](const BlockBuildingContext &,
                                       BlockState &) {
            return pre_block_call_result_;
          }));
      ON_CALL(*block, commitTx(_, _, _))
          .WillByDefault(Invoke([this](const SignedTransaction &tx,
                                       const BlockBuildingContext &ctx,
                                       BlockState &state) {
            return commit(tx, ctx, state);
          }));
      ON_CALL(*block, finalize(_, _, _))
          .WillByDefault(Invoke([this](BlockState &,
                                       const BlockBuildingContext &ctx,
                                       RootHashTaskPool &pool) {
            return finalize(ctx, pool);
          }));
      ON_CALL(*block, simulatedGasUsed()).WillByDefault(Invoke([this] {
        return kTransferGas * committed_.size();
      }));
      return block;
    }

    blockforge::outcome::result<ExecutionResult> commit(
        const SignedTransaction &tx,
        const BlockBuildingContext &ctx,
        BlockState &state) {
      steady_now_ += commit_step_;
      attempted_nonces_.push_back(tx.transaction.nonce);
      if (fail_attempt_ and fail_attempt_(attempted_nonces_.size() - 1)) {
        return ExecutionError::INVALID_TRANSACTION;
      }

      OUTCOME_TRY(nonce, state.nonce(tx.signer));
      if (tx.transaction.nonce != nonce) {
        return tx.transaction.nonce < nonce ? ExecutionError::NONCE_TOO_LOW
                                            : ExecutionError::NONCE_TOO_HIGH;
      }
      OUTCOME_TRY(state.setNonce(tx.signer, nonce + 1));
      if (drain_coinbase_) {
        OUTCOME_TRY(state.setBalance(ctx.coinbase, U256{0}));
      } else {
        OUTCOME_TRY(state.incrementBalance(tx.transaction.to.value(),
                                           tx.transaction.value));
      }

      committed_.push_back(tx);
      return ExecutionResult{.tx = tx,
                             .gas_used = kTransferGas,
                             .coinbase_profit = tx.transaction.value};
    }

    blockforge::outcome::result<FinalizedBlock> finalize(
        const BlockBuildingContext &ctx, RootHashTaskPool &pool) {
      if (finalize_error_) {
        return *finalize_error_;
      }
      FinalizedBlock finalized;
      auto &header = finalized.sealed_block.header;
      header.parent_hash = ctx.parent_hash;
      header.number = ctx.block_number;
      header.beneficiary = ctx.coinbase;
      header.gas_used = kTransferGas * committed_.size();
      header.transactions_root =
          pool.runBlocking([n = committed_.size()] {
            Hash256 root;
            root[0] = static_cast<uint8_t>(n);
            return root;
          });
      finalized.sealed_block.body = committed_;
      return finalized;
    }

    Secp256k1Signer signer_ =
        Secp256k1Signer::fromHex(
            "4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318")
            .value();
    const Address builder_address_ =
        "0x00000000000000000000000000000000000000aa"_address;
    const Address fee_recipient_ =
        "0x00000000000000000000000000000000000000fe"_address;

    BlockBuildingContext ctx_;
    FillerBuilderConfig config_;

    std::shared_ptr<StateProviderFactoryMock> provider_factory_ =
        std::make_shared<NiceMock<StateProviderFactoryMock>>();
    std::shared_ptr<StateProviderMock> state_provider_ =
        std::make_shared<NiceMock<StateProviderMock>>();
    std::shared_ptr<PartialBlockFactoryMock> partial_block_factory_ =
        std::make_shared<NiceMock<PartialBlockFactoryMock>>();
    std::shared_ptr<SlotBidderMock> slot_bidder_ =
        std::make_shared<NiceMock<SlotBidderMock>>();
    std::shared_ptr<BuiltBlockMetricsMock> metrics_ =
        std::make_shared<NiceMock<BuiltBlockMetricsMock>>();
    std::shared_ptr<SteadyClockMock> steady_clock_ =
        std::make_shared<NiceMock<SteadyClockMock>>();
    std::shared_ptr<SystemClockMock> system_clock_ =
        std::make_shared<NiceMock<SystemClockMock>>();
    std::shared_ptr<RootHashTaskPool> root_hash_pool_ =
        std::make_shared<RootHashTaskPool>(1);

    SteadyClock::TimePoint steady_now_{std::chrono::seconds{1000}};
    std::chrono::milliseconds commit_step_{0};
    const SystemClock::TimePoint system_now_{std::chrono::seconds{1700000000}};

    blockforge::outcome::result<void> pre_block_call_result_ =
        blockforge::outcome::success();
    /// forces a failure of the n-th commit attempt of a build
    std::function<bool(size_t)> fail_attempt_;
    /// commits empty the coinbase balance instead of paying it
    bool drain_coinbase_ = false;
    std::optional<ExecutionError> finalize_error_;

    std::vector<BlockBuildingContext> made_contexts_;
    std::vector<Nonce> attempted_nonces_;
    std::vector<SignedTransaction> committed_;
  };

}  // namespace testutil
