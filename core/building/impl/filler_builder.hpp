/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "application/filler_builder_config.hpp"
#include "bidding/slot_bidder.hpp"
#include "building/block.hpp"
#include "building/block_building_context.hpp"
#include "building/root_hash_task_pool.hpp"
#include "clock/clock.hpp"
#include "execution/partial_block_factory.hpp"
#include "log/logger.hpp"
#include "state/cached_reads.hpp"
#include "state/state_provider_factory.hpp"
#include "telemetry/built_block_metrics.hpp"

namespace blockforge::building {

  /**
   * Builds one block for a slot out of filler transactions. An instance is
   * driven by a single caller and keeps the state reads of its last
   * finalized block for the next attempt on the same parent.
   */
  class FillerBuilder {
   public:
    /// upper bound of filler transactions tried per block
    static constexpr size_t kMaxFillerAttempts = 10;

    FillerBuilder(
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
        std::optional<std::chrono::milliseconds> deadline);

    /**
     * Runs one build attempt
     * @return the block if the slot bidder accepted it, std::nullopt if it
     * declined, error if the block could not be built
     */
    outcome::result<std::optional<Block>> buildBlock();

    const std::optional<state::CachedReads> &cachedReads() const {
      return cached_reads_;
    }

    /// hashes of fillers that failed to commit during the last attempt
    const std::unordered_set<common::Hash256> &failedOrders() const {
      return failed_orders_;
    }

    /// commit attempts per filler hash during the last attempt
    const std::unordered_map<common::Hash256, size_t> &orderAttempts() const {
      return order_attempts_;
    }

   private:
    bool deadlineReached(clock::SteadyClock::TimePoint build_start) const;

    log::Logger log_;
    std::shared_ptr<state::StateProviderFactory> provider_factory_;
    std::shared_ptr<execution::PartialBlockFactory> partial_block_factory_;
    std::shared_ptr<bidding::SlotBidder> slot_bidder_;
    std::shared_ptr<RootHashTaskPool> root_hash_pool_;
    std::shared_ptr<telemetry::BuiltBlockMetrics> metrics_;
    std::shared_ptr<clock::SteadyClock> steady_clock_;
    std::shared_ptr<clock::SystemClock> system_clock_;
    std::string builder_name_;
    BlockBuildingContext ctx_;
    application::FillerBuilderConfig config_;
    crypto::Secp256k1Signer filler_signer_;
    std::optional<std::chrono::milliseconds> deadline_;

    std::optional<state::CachedReads> cached_reads_;

    std::unordered_set<common::Hash256> failed_orders_;
    std::unordered_map<common::Hash256, size_t> order_attempts_;
  };

}  // namespace blockforge::building
