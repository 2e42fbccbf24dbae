/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace blockforge::execution {

  /**
   * @brief ExecutionError describes failures of executing transactions on top
   * of a partial block and of sealing it
   */
  enum class ExecutionError {
    NONCE_TOO_LOW = 1,
    NONCE_TOO_HIGH,
    INSUFFICIENT_FUNDS,
    BLOCK_GAS_LIMIT_REACHED,
    FEE_CAP_BELOW_BASEFEE,
    INVALID_TRANSACTION,
    PRE_BLOCK_CALL_FAILED,
    ROOT_HASH_FAILED,
    FINALIZE_FAILED,
  };

}  // namespace blockforge::execution

OUTCOME_HPP_DECLARE_ERROR(blockforge::execution, ExecutionError)
