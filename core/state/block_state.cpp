/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state/block_state.hpp"

#include <utility>

#include <boost/assert.hpp>

namespace blockforge::state {

  BlockState::BlockState(std::shared_ptr<const StateProvider> provider,
                         CachedReads cached_reads)
      : provider_{std::move(provider)},
        cached_reads_{std::move(cached_reads)} {
    BOOST_ASSERT(provider_ != nullptr);
  }

  outcome::result<std::optional<AccountInfo>> BlockState::loadAccount(
      const primitives::Address &address) {
    if (auto cached = cached_reads_.account(address); cached != nullptr) {
      return *cached;
    }
    OUTCOME_TRY(info, provider_->basicAccount(address));
    cached_reads_.insertAccount(address, info);
    return info;
  }

  outcome::result<AccountInfo> BlockState::mutableAccount(
      const primitives::Address &address) {
    OUTCOME_TRY(info, basicAccount(address));
    return info.value_or(AccountInfo{});
  }

  outcome::result<std::optional<AccountInfo>> BlockState::basicAccount(
      const primitives::Address &address) {
    if (auto it = accounts_overlay_.find(address);
        it != accounts_overlay_.end()) {
      return it->second;
    }
    return loadAccount(address);
  }

  outcome::result<primitives::U256> BlockState::balance(
      const primitives::Address &address) {
    OUTCOME_TRY(info, basicAccount(address));
    if (not info) {
      return primitives::U256{0};
    }
    return info->balance;
  }

  outcome::result<primitives::Nonce> BlockState::nonce(
      const primitives::Address &address) {
    OUTCOME_TRY(info, basicAccount(address));
    if (not info) {
      return primitives::Nonce{0};
    }
    return info->nonce;
  }

  outcome::result<primitives::U256> BlockState::storage(
      const primitives::Address &address, const common::Hash256 &slot) {
    if (auto it = storage_overlay_.find(StorageKey{address, slot});
        it != storage_overlay_.end()) {
      return it->second;
    }
    if (auto cached = cached_reads_.storage(address, slot)) {
      return *cached;
    }
    OUTCOME_TRY(value, provider_->storage(address, slot));
    auto result = value.value_or(primitives::U256{0});
    cached_reads_.insertStorage(address, slot, result);
    return result;
  }

  outcome::result<void> BlockState::setBalance(
      const primitives::Address &address, primitives::U256 balance) {
    OUTCOME_TRY(info, mutableAccount(address));
    info.balance = std::move(balance);
    accounts_overlay_.insert_or_assign(address, std::move(info));
    return outcome::success();
  }

  outcome::result<void> BlockState::incrementBalance(
      const primitives::Address &address, const primitives::U256 &delta) {
    OUTCOME_TRY(info, mutableAccount(address));
    info.balance += delta;
    accounts_overlay_.insert_or_assign(address, std::move(info));
    return outcome::success();
  }

  outcome::result<void> BlockState::setNonce(const primitives::Address &address,
                                             primitives::Nonce nonce) {
    OUTCOME_TRY(info, mutableAccount(address));
    info.nonce = nonce;
    accounts_overlay_.insert_or_assign(address, std::move(info));
    return outcome::success();
  }

  void BlockState::setStorage(const primitives::Address &address,
                              const common::Hash256 &slot,
                              primitives::U256 value) {
    storage_overlay_.insert_or_assign(StorageKey{address, slot},
                                      std::move(value));
  }

  CachedReads BlockState::takeCachedReads() {
    return std::exchange(cached_reads_, CachedReads{});
  }

}  // namespace blockforge::state
