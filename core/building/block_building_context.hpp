/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "primitives/common.hpp"

namespace blockforge::building {

  /**
   * Everything known about the block to build for one slot
   */
  struct BlockBuildingContext {
    common::Hash256 parent_hash;
    primitives::BlockNumber block_number{};
    primitives::Timestamp timestamp{};
    primitives::U256 basefee{};
    primitives::Gas gas_limit{};
    primitives::ChainId chain_id{};
    /// beneficiary written to the header
    primitives::Address coinbase;
    /// fee recipient requested by the proposer
    primitives::Address suggested_fee_recipient;
    /// set when the builder collects fees itself and pays the proposer
    /// with a separate transaction
    std::optional<primitives::Address> builder_signer;

    /**
     * @return copy of this context where the proposer's fee recipient is the
     * coinbase and no builder payment is made
     */
    BlockBuildingContext withSuggestedFeeRecipientAsCoinbase() const;

    bool operator==(const BlockBuildingContext &other) const = default;
  };

}  // namespace blockforge::building
