/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "state/cached_reads.hpp"
#include "state/state_provider.hpp"

namespace blockforge::state {

  /**
   * Mutable view of the state of the block being built. Reads go to the
   * overlay of changes made by this block first, then to the cached reads
   * and finally to the parent snapshot, whose answers are cached.
   */
  class BlockState {
   public:
    BlockState(std::shared_ptr<const StateProvider> provider,
               CachedReads cached_reads);

    BlockState(const BlockState &) = delete;
    BlockState &operator=(const BlockState &) = delete;
    BlockState(BlockState &&) = default;
    BlockState &operator=(BlockState &&) = default;
    ~BlockState() = default;

    outcome::result<std::optional<AccountInfo>> basicAccount(
        const primitives::Address &address);

    /// balance of the account, zero for a missing account
    outcome::result<primitives::U256> balance(
        const primitives::Address &address);

    /// nonce of the account, zero for a missing account
    outcome::result<primitives::Nonce> nonce(
        const primitives::Address &address);

    /// value of the storage slot, zero if never written
    outcome::result<primitives::U256> storage(
        const primitives::Address &address, const common::Hash256 &slot);

    outcome::result<void> setBalance(const primitives::Address &address,
                                     primitives::U256 balance);

    outcome::result<void> incrementBalance(const primitives::Address &address,
                                           const primitives::U256 &delta);

    outcome::result<void> setNonce(const primitives::Address &address,
                                   primitives::Nonce nonce);

    void setStorage(const primitives::Address &address,
                    const common::Hash256 &slot,
                    primitives::U256 value);

    const StateProvider &provider() const {
      return *provider_;
    }

    /// pre-state values read so far
    const CachedReads &cachedReads() const {
      return cached_reads_;
    }

    /**
     * Moves the cached reads out, leaving this view with an empty cache
     */
    CachedReads takeCachedReads();

   private:
    outcome::result<std::optional<AccountInfo>> loadAccount(
        const primitives::Address &address);

    outcome::result<AccountInfo> mutableAccount(
        const primitives::Address &address);

    std::shared_ptr<const StateProvider> provider_;
    CachedReads cached_reads_;
    std::unordered_map<primitives::Address, AccountInfo> accounts_overlay_;
    std::unordered_map<StorageKey, primitives::U256> storage_overlay_;
  };

}  // namespace blockforge::state
