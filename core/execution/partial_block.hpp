/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "building/block_building_context.hpp"
#include "building/root_hash_task_pool.hpp"
#include "execution/execution_result.hpp"
#include "primitives/block.hpp"
#include "state/block_state.hpp"

namespace blockforge::execution {

  struct FinalizedBlock {
    primitives::SealedBlock sealed_block;
    std::vector<primitives::BlobSidecar> txs_blob_sidecars;
  };

  /**
   * Block under construction. Executes transactions against a BlockState and
   * seals the result. Errors are reported as ExecutionError or as the error
   * of the underlying state access.
   */
  class PartialBlock {
   public:
    virtual ~PartialBlock() = default;

    /**
     * Applies the system operations every block starts with
     */
    virtual outcome::result<void> preBlockCall(
        const building::BlockBuildingContext &ctx,
        state::BlockState &state) = 0;

    /**
     * Executes tx on top of the current state. A failed transaction leaves
     * both the block and the state untouched.
     */
    virtual outcome::result<ExecutionResult> commitTx(
        const primitives::SignedTransaction &tx,
        const building::BlockBuildingContext &ctx,
        state::BlockState &state) = 0;

    /**
     * Computes the state root on root_hash_pool and seals header and body
     */
    virtual outcome::result<FinalizedBlock> finalize(
        state::BlockState &state,
        const building::BlockBuildingContext &ctx,
        building::RootHashTaskPool &root_hash_pool) = 0;

    /// gas measured by the simulation tracer, refunds excluded
    virtual primitives::Gas simulatedGasUsed() const = 0;
  };

}  // namespace blockforge::execution
