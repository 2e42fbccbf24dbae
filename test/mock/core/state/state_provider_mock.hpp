/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "state/state_provider.hpp"

#include <gmock/gmock.h>

namespace blockforge::state {

  class StateProviderMock : public StateProvider {
   public:
    MOCK_CONST_METHOD1(
        basicAccount,
        outcome::result<std::optional<AccountInfo>>(const primitives::Address &));

    MOCK_CONST_METHOD1(
        accountBalance,
        outcome::result<std::optional<primitives::U256>>(
            const primitives::Address &));

    MOCK_CONST_METHOD2(storage,
                       outcome::result<std::optional<primitives::U256>>(
                           const primitives::Address &,
                           const common::Hash256 &));
  };

}  // namespace blockforge::state
