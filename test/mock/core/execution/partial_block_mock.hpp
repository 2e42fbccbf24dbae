/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "execution/partial_block.hpp"

#include <gmock/gmock.h>

namespace blockforge::execution {

  class PartialBlockMock : public PartialBlock {
   public:
    MOCK_METHOD2(preBlockCall,
                 outcome::result<void>(const building::BlockBuildingContext &,
                                       state::BlockState &));

    MOCK_METHOD3(commitTx,
                 outcome::result<ExecutionResult>(
                     const primitives::SignedTransaction &,
                     const building::BlockBuildingContext &,
                     state::BlockState &));

    MOCK_METHOD3(finalize,
                 outcome::result<FinalizedBlock>(
                     state::BlockState &,
                     const building::BlockBuildingContext &,
                     building::RootHashTaskPool &));

    MOCK_CONST_METHOD0(simulatedGasUsed, primitives::Gas());
  };

}  // namespace blockforge::execution
