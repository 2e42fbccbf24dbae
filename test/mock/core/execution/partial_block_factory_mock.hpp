/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "execution/partial_block_factory.hpp"

#include <gmock/gmock.h>

namespace blockforge::execution {

  class PartialBlockFactoryMock : public PartialBlockFactory {
   public:
    MOCK_CONST_METHOD1(
        make,
        std::unique_ptr<PartialBlock>(const building::BlockBuildingContext &));
  };

}  // namespace blockforge::execution
