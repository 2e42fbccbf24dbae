/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "building/block_building_context.hpp"

namespace blockforge::building {

  BlockBuildingContext BlockBuildingContext::withSuggestedFeeRecipientAsCoinbase()
      const {
    auto ctx = *this;
    ctx.coinbase = suggested_fee_recipient;
    ctx.builder_signer.reset();
    return ctx;
  }

}  // namespace blockforge::building
