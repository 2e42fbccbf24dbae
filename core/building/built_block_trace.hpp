/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <vector>

#include "clock/clock.hpp"
#include "execution/execution_result.hpp"

namespace blockforge::building {

  /**
   * Record of how a block was built: what was included, what it earned and
   * how long each phase took
   */
  struct BuiltBlockTrace {
    std::vector<execution::ExecutionResult> included_orders;
    /// value the bid was sealed with
    primitives::U256 bid_value{};
    /// profit measured for the fee recipient before bidding
    primitives::U256 true_bid_value{};
    /// sum of coinbase profits reported by the included orders
    primitives::U256 coinbase_reward{};
    /// profit was accounted as a payment to the proposer
    bool coinbase_payment{false};
    std::chrono::microseconds fill_time{};
    std::chrono::microseconds finalize_time{};
    std::optional<clock::SystemClock::TimePoint> orders_closed_at;
    std::optional<clock::SystemClock::TimePoint> orders_sealed_at;

    void addIncludedOrder(execution::ExecutionResult result);

    /**
     * @param closed_at moment the set of orders considered for the block was
     * fixed
     * @param sealed_at moment the block was sealed
     */
    void updateOrdersTimestampsAfterBlockSealed(
        clock::SystemClock::TimePoint closed_at,
        clock::SystemClock::TimePoint sealed_at);
  };

}  // namespace blockforge::building
