/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "building/impl/filler_builder.hpp"

#include <utility>

#include <boost/assert.hpp>

#include "building/impl/filler_factory.hpp"
#include "state/block_state.hpp"

namespace blockforge::building {
  using std::chrono::duration_cast;
  using std::chrono::microseconds;

  FillerBuilder::FillerBuilder(
      std::shared_ptr<state::StateProviderFactory> provider_factory,
      std::shared_ptr<execution::PartialBlockFactory> partial_block_factory,
      std::shared_ptr<bidding::SlotBidder> slot_bidder,
      std::shared_ptr<RootHashTaskPool> root_hash_pool,
      std::shared_ptr<telemetry::BuiltBlockMetrics> metrics,
      std::shared_ptr<clock::SteadyClock> steady_clock,
      std::shared_ptr<clock::SystemClock> system_clock,
      std::string builder_name,
      BlockBuildingContext ctx,
      application::FillerBuilderConfig config,
      crypto::Secp256k1Signer filler_signer,
      std::optional<std::chrono::milliseconds> deadline)
      : log_{log::createLogger("FillerBuilder", "building")},
        provider_factory_{std::move(provider_factory)},
        partial_block_factory_{std::move(partial_block_factory)},
        slot_bidder_{std::move(slot_bidder)},
        root_hash_pool_{std::move(root_hash_pool)},
        metrics_{std::move(metrics)},
        steady_clock_{std::move(steady_clock)},
        system_clock_{std::move(system_clock)},
        builder_name_{std::move(builder_name)},
        ctx_{std::move(ctx)},
        config_{std::move(config)},
        filler_signer_{std::move(filler_signer)},
        deadline_{deadline} {
    BOOST_ASSERT(provider_factory_ != nullptr);
    BOOST_ASSERT(partial_block_factory_ != nullptr);
    BOOST_ASSERT(slot_bidder_ != nullptr);
    BOOST_ASSERT(root_hash_pool_ != nullptr);
    BOOST_ASSERT(metrics_ != nullptr);
    BOOST_ASSERT(steady_clock_ != nullptr);
    BOOST_ASSERT(system_clock_ != nullptr);
  }

  bool FillerBuilder::deadlineReached(
      clock::SteadyClock::TimePoint build_start) const {
    return deadline_.has_value()
       and steady_clock_->now() - build_start >= *deadline_;
  }

  outcome::result<std::optional<Block>> FillerBuilder::buildBlock() {
    OUTCOME_TRY(provider_factory_->checkHealth(ctx_.block_number));

    const auto build_start = steady_clock_->now();
    const auto orders_closed_at = system_clock_->now();

    // profit is measured for the proposer's fee recipient
    const auto ctx = ctx_.withSuggestedFeeRecipientAsCoinbase();

    failed_orders_.clear();
    order_attempts_.clear();

    // restored only when the bidder declines
    auto previous_reads = std::exchange(cached_reads_, std::nullopt);

    OUTCOME_TRY(state_provider,
                provider_factory_->historyByBlockHash(ctx.parent_hash));

    OUTCOME_TRY(balance_before,
                state_provider->accountBalance(ctx.suggested_fee_recipient));
    const auto fee_recipient_balance_before =
        balance_before.value_or(primitives::U256{0});

    auto partial_block = partial_block_factory_->make(ctx);
    state::BlockState state{
        state_provider,
        previous_reads ? *previous_reads : state::CachedReads{}};
    OUTCOME_TRY(partial_block->preBlockCall(ctx, state));

    BuiltBlockTrace trace;
    trace.coinbase_payment = config_.coinbase_payment;

    SL_INFO(log_,
            "Generating filler transactions from {}, coinbase is {}",
            filler_signer_.address(),
            ctx.coinbase);
    OUTCOME_TRY(current_nonce, state.nonce(filler_signer_.address()));
    FillerFactory fillers{filler_signer_,
                          ctx.chain_id,
                          current_nonce,
                          ctx.coinbase,
                          config_.filler_tx_value};

    for (size_t attempt = 0; attempt < kMaxFillerAttempts; ++attempt) {
      if (deadlineReached(build_start)) {
        SL_DEBUG(log_,
                 "Build deadline reached after {} filler transactions",
                 attempt);
        break;
      }
      auto tx = fillers.next(ctx.basefee);
      ++order_attempts_[tx.hash];

      const auto commit_start = steady_clock_->now();
      auto commit_res = partial_block->commitTx(tx, ctx, state);
      const auto commit_time =
          duration_cast<microseconds>(steady_clock_->now() - commit_start);

      primitives::Gas gas_used = 0;
      std::string execution_error;
      const bool success = commit_res.has_value();
      if (success) {
        gas_used = commit_res.value().gas_used;
        trace.addIncludedOrder(std::move(commit_res.value()));
      } else {
        failed_orders_.insert(tx.hash);
        execution_error = commit_res.error().message();
      }
      fillers.advanceNonce();
      SL_TRACE(log_,
               "Executed order: success={} order_commit_time_mus={} "
               "gas_used={} execution_error={}",
               success,
               commit_time.count(),
               gas_used,
               execution_error);
    }

    OUTCOME_TRY(balance_after, state.balance(ctx.suggested_fee_recipient));
    const primitives::U256 fee_recipient_balance_diff =
        balance_after > fee_recipient_balance_before
            ? primitives::U256{balance_after - fee_recipient_balance_before}
            : primitives::U256{0};

    auto bid_value =
        slot_bidder_->sealBid(fee_recipient_balance_diff, ctx.timestamp);
    if (not bid_value) {
      SL_TRACE(log_,
               "Skipped block finalization: block={} builder_name={}",
               ctx.block_number,
               builder_name_);
      cached_reads_ = std::move(previous_reads);
      return std::nullopt;
    }
    trace.bid_value = std::move(*bid_value);
    trace.true_bid_value = fee_recipient_balance_diff;

    const auto build_time =
        duration_cast<microseconds>(steady_clock_->now() - build_start);
    trace.fill_time = build_time;

    const auto finalize_start = steady_clock_->now();
    const auto sim_gas_used = partial_block->simulatedGasUsed();
    OUTCOME_TRY(finalized,
                partial_block->finalize(state, ctx, *root_hash_pool_));
    trace.updateOrdersTimestampsAfterBlockSealed(orders_closed_at,
                                                 system_clock_->now());

    cached_reads_ = state.takeCachedReads();

    const auto finalize_time =
        duration_cast<microseconds>(steady_clock_->now() - finalize_start);
    trace.finalize_time = finalize_time;

    const auto txs = finalized.sealed_block.body.size();
    const auto gas_used = finalized.sealed_block.header.gas_used;
    const auto blobs = finalized.txs_blob_sidecars.size();

    metrics_->addBuiltBlockMetrics(build_time,
                                   finalize_time,
                                   txs,
                                   blobs,
                                   gas_used,
                                   sim_gas_used,
                                   builder_name_,
                                   ctx.timestamp);

    SL_TRACE(log_,
             "Built block: block={} build_time_mus={} finalize_time_mus={} "
             "profit={} builder_name={} txs={} blobs={} gas_used={} "
             "sim_gas_used={}",
             ctx.block_number,
             build_time.count(),
             finalize_time.count(),
             primitives::formatEther(trace.bid_value),
             builder_name_,
             txs,
             blobs,
             gas_used,
             sim_gas_used);

    return std::make_optional(Block{
        .trace = std::move(trace),
        .sealed_block = std::move(finalized.sealed_block),
        .txs_blobs_sidecars = std::move(finalized.txs_blob_sidecars),
        .builder_name = builder_name_,
    });
  }

}  // namespace blockforge::building
