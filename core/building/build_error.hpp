/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include "outcome/outcome.hpp"

namespace blockforge::building {

  enum class BuildError {
    /// the block does not earn enough to be worth submitting
    PROFIT_TOO_LOW = 1,
  };

  /**
   * How a failed build attempt affects the slot
   */
  enum class BuildErrorClass {
    /// building on this parent is impossible, every algorithm should stop
    CANCEL_SLOT,
    /// expected outcome, nothing to report
    NOT_PROFITABLE,
    /// state access is broken and needs operator attention
    INFRASTRUCTURE,
    OTHER,
  };

  BuildErrorClass classifyBuildError(const std::error_code &error);

}  // namespace blockforge::building

OUTCOME_HPP_DECLARE_ERROR(blockforge::building, BuildError)
