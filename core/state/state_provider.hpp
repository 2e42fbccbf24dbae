/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "state/account.hpp"

namespace blockforge::state {

  /**
   * Read-only snapshot of the chain state as of one block. Implemented by
   * the chain database layer.
   */
  class StateProvider {
   public:
    virtual ~StateProvider() = default;

    /**
     * @return account info, std::nullopt if the account does not exist
     */
    virtual outcome::result<std::optional<AccountInfo>> basicAccount(
        const primitives::Address &address) const = 0;

    /**
     * @return balance of the account, std::nullopt if it does not exist
     */
    virtual outcome::result<std::optional<primitives::U256>> accountBalance(
        const primitives::Address &address) const = 0;

    /**
     * @return value of the storage slot, std::nullopt if never written
     */
    virtual outcome::result<std::optional<primitives::U256>> storage(
        const primitives::Address &address,
        const common::Hash256 &slot) const = 0;
  };

}  // namespace blockforge::state
