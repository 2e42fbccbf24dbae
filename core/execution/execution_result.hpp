/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/transaction.hpp"

namespace blockforge::execution {

  /**
   * Outcome of one transaction committed to a partial block
   */
  struct ExecutionResult {
    primitives::SignedTransaction tx;
    primitives::Gas gas_used{};
    primitives::Gas blob_gas_used{};
    /// payment received by the block coinbase from this transaction
    primitives::U256 coinbase_profit{};

    bool operator==(const ExecutionResult &other) const = default;
  };

}  // namespace blockforge::execution
