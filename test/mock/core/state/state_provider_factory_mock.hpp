/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "state/state_provider_factory.hpp"

#include <gmock/gmock.h>

namespace blockforge::state {

  class StateProviderFactoryMock : public StateProviderFactory {
   public:
    MOCK_CONST_METHOD1(checkHealth,
                       outcome::result<void>(primitives::BlockNumber));

    MOCK_CONST_METHOD1(historyByBlockHash,
                       outcome::result<std::shared_ptr<StateProvider>>(
                           const common::Hash256 &));

    MOCK_CONST_METHOD0(lastBlockNumber,
                       outcome::result<primitives::BlockNumber>());
  };

}  // namespace blockforge::state
