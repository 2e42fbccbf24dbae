/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "building/built_block_trace.hpp"

namespace blockforge::building {

  void BuiltBlockTrace::addIncludedOrder(execution::ExecutionResult result) {
    coinbase_reward += result.coinbase_profit;
    included_orders.emplace_back(std::move(result));
  }

  void BuiltBlockTrace::updateOrdersTimestampsAfterBlockSealed(
      clock::SystemClock::TimePoint closed_at,
      clock::SystemClock::TimePoint sealed_at) {
    orders_closed_at = closed_at;
    orders_sealed_at = sealed_at;
  }

}  // namespace blockforge::building
