/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "state/state_provider.hpp"

namespace blockforge::state {

  /**
   * Entry point to the chain database: health checks and historical state
   * snapshots. Errors are reported as StateProviderError.
   */
  class StateProviderFactory {
   public:
    virtual ~StateProviderFactory() = default;

    /**
     * Verifies that state can be served for building on top of the parent of
     * block_number
     */
    virtual outcome::result<void> checkHealth(
        primitives::BlockNumber block_number) const = 0;

    /**
     * Opens a snapshot of the state as of the block with the given hash
     */
    virtual outcome::result<std::shared_ptr<StateProvider>> historyByBlockHash(
        const common::Hash256 &block_hash) const = 0;

    virtual outcome::result<primitives::BlockNumber> lastBlockNumber()
        const = 0;
  };

}  // namespace blockforge::state
