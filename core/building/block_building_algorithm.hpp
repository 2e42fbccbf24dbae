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

#include "bidding/slot_bidder.hpp"
#include "building/block_building_context.hpp"
#include "building/block_building_sink.hpp"
#include "building/cancellation_token.hpp"
#include "execution/partial_block_factory.hpp"
#include "state/state_provider_factory.hpp"

namespace blockforge::building {

  /**
   * Everything an algorithm needs to build blocks for one slot
   */
  struct BlockBuildingAlgorithmInput {
    std::shared_ptr<state::StateProviderFactory> provider_factory;
    BlockBuildingContext ctx;
    std::shared_ptr<BlockBuildingSink> sink;
    std::shared_ptr<bidding::SlotBidder> slot_bidder;
    std::shared_ptr<CancellationToken> cancel;
    std::shared_ptr<execution::PartialBlockFactory> partial_block_factory;
    /// time the slot allows for filling a block, if limited
    std::optional<std::chrono::milliseconds> deadline;
  };

  /**
   * Block building strategy. Several algorithms may build for the same slot
   * concurrently, they coordinate only through the cancellation token.
   */
  class BlockBuildingAlgorithm {
   public:
    virtual ~BlockBuildingAlgorithm() = default;

    virtual std::string name() const = 0;

    /**
     * Builds for the slot described by input, delivering results to its sink
     */
    virtual void buildBlocks(const BlockBuildingAlgorithmInput &input) = 0;
  };

}  // namespace blockforge::building
