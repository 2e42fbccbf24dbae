/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <unordered_map>

#include "state/account.hpp"

namespace blockforge::state {

  /**
   * Values read from a parent state snapshot. Only pre-state values are
   * stored here, so the cache stays valid for every later build attempt on
   * top of the same parent.
   */
  class CachedReads {
   public:
    /**
     * @param info account info or std::nullopt when the account is known to
     * not exist
     */
    void insertAccount(const primitives::Address &address,
                       std::optional<AccountInfo> info);

    void insertStorage(const primitives::Address &address,
                       const common::Hash256 &slot,
                       primitives::U256 value);

    /**
     * @return nullptr if the account was never read, otherwise a pointer to
     * the cached lookup result
     */
    const std::optional<AccountInfo> *account(
        const primitives::Address &address) const;

    std::optional<primitives::U256> storage(const primitives::Address &address,
                                            const common::Hash256 &slot) const;

    /// number of cached accounts and storage slots
    size_t size() const;

    bool empty() const {
      return size() == 0;
    }

    bool operator==(const CachedReads &other) const = default;

   private:
    std::unordered_map<primitives::Address, std::optional<AccountInfo>>
        accounts_;
    std::unordered_map<StorageKey, primitives::U256> storage_;
  };

}  // namespace blockforge::state
