/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "building/block.hpp"

namespace blockforge::building {

  /**
   * Receiver of the blocks built for a slot
   */
  class BlockBuildingSink {
   public:
    virtual ~BlockBuildingSink() = default;

    virtual void newBlock(Block block) = 0;
  };

}  // namespace blockforge::building
