/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "execution/partial_block.hpp"

namespace blockforge::execution {

  /**
   * Creates partial blocks, one per build attempt
   */
  class PartialBlockFactory {
   public:
    virtual ~PartialBlockFactory() = default;

    virtual std::unique_ptr<PartialBlock> make(
        const building::BlockBuildingContext &ctx) const = 0;
  };

}  // namespace blockforge::execution
