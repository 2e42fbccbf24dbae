/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace blockforge::state {

  /**
   * @enum StateProviderError
   * @brief Failures reported by the chain state access layer
   */
  enum class StateProviderError {
    /// @brief A consistent view of the state as of the requested parent block
    /// can no longer be established (the head moved past it or it was
    /// reorged out)
    CONSISTENT_VIEW_UNAVAILABLE = 1,
    /// @brief The provider failed its health check, e.g. it lags behind the
    /// chain head
    PROVIDER_UNHEALTHY,
    /// @brief The underlying database returned an error
    DATABASE_FAILURE,
    /// @brief The requested block is not known to the provider
    BLOCK_NOT_FOUND,
    /// @brief State for the requested block has been pruned
    STATE_NOT_AVAILABLE,
  };

}  // namespace blockforge::state

OUTCOME_HPP_DECLARE_ERROR(blockforge::state, StateProviderError)
