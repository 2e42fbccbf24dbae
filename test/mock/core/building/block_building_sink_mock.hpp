/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "building/block_building_sink.hpp"

#include <gmock/gmock.h>

namespace blockforge::building {

  class BlockBuildingSinkMock : public BlockBuildingSink {
   public:
    MOCK_METHOD1(newBlock, void(Block));
  };

}  // namespace blockforge::building
