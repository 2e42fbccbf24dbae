/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "execution/execution_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockforge::execution, ExecutionError, e) {
  using E = blockforge::execution::ExecutionError;
  switch (e) {
    case E::NONCE_TOO_LOW:
      return "transaction nonce is lower than the account nonce";
    case E::NONCE_TOO_HIGH:
      return "transaction nonce is higher than the account nonce";
    case E::INSUFFICIENT_FUNDS:
      return "sender balance does not cover gas and value";
    case E::BLOCK_GAS_LIMIT_REACHED:
      return "transaction gas limit exceeds the gas left in the block";
    case E::FEE_CAP_BELOW_BASEFEE:
      return "max fee per gas is below the block basefee";
    case E::INVALID_TRANSACTION:
      return "invalid transaction";
    case E::PRE_BLOCK_CALL_FAILED:
      return "pre block system call failed";
    case E::ROOT_HASH_FAILED:
      return "state root computation failed";
    case E::FINALIZE_FAILED:
      return "block finalization failed";
  }
  return "unknown error";
}
