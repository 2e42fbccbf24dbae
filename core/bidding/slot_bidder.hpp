/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "primitives/common.hpp"

namespace blockforge::bidding {

  /**
   * Bidding policy of a slot. Decides whether a block worth the given profit
   * should be sealed and submitted, and with which bid.
   */
  class SlotBidder {
   public:
    virtual ~SlotBidder() = default;

    /**
     * @param unsealed_block_profit profit of the block for the fee recipient
     * @param slot_timestamp timestamp of the slot the block is built for
     * @return value to seal the bid with, std::nullopt to skip the block
     */
    virtual std::optional<primitives::U256> sealBid(
        const primitives::U256 &unsealed_block_profit,
        primitives::Timestamp slot_timestamp) const = 0;
  };

}  // namespace blockforge::bidding
