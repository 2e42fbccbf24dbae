/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state/state_provider_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockforge::state, StateProviderError, e) {
  using E = blockforge::state::StateProviderError;
  switch (e) {
    case E::CONSISTENT_VIEW_UNAVAILABLE:
      return "failed to initialize consistent view of the parent state";
    case E::PROVIDER_UNHEALTHY:
      return "state provider failed its health check";
    case E::DATABASE_FAILURE:
      return "state database failure";
    case E::BLOCK_NOT_FOUND:
      return "block not found";
    case E::STATE_NOT_AVAILABLE:
      return "state for the block is not available";
  }
  return "unknown error";
}
