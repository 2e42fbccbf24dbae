/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "building/build_error.hpp"

#include "state/state_provider_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockforge::building, BuildError, e) {
  using E = blockforge::building::BuildError;
  switch (e) {
    case E::PROFIT_TOO_LOW:
      return "Profit too low";
  }
  return "unknown error";
}

namespace blockforge::building {

  BuildErrorClass classifyBuildError(const std::error_code &error) {
    using state::StateProviderError;
    if (error == StateProviderError::CONSISTENT_VIEW_UNAVAILABLE) {
      return BuildErrorClass::CANCEL_SLOT;
    }
    if (error == BuildError::PROFIT_TOO_LOW) {
      return BuildErrorClass::NOT_PROFITABLE;
    }
    if (error == StateProviderError::PROVIDER_UNHEALTHY
        or error == StateProviderError::DATABASE_FAILURE) {
      return BuildErrorClass::INFRASTRUCTURE;
    }
    return BuildErrorClass::OTHER;
  }

}  // namespace blockforge::building
