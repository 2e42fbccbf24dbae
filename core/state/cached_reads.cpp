/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "state/cached_reads.hpp"

namespace blockforge::state {

  void CachedReads::insertAccount(const primitives::Address &address,
                                  std::optional<AccountInfo> info) {
    accounts_.insert_or_assign(address, std::move(info));
  }

  void CachedReads::insertStorage(const primitives::Address &address,
                                  const common::Hash256 &slot,
                                  primitives::U256 value) {
    storage_.insert_or_assign(StorageKey{address, slot}, std::move(value));
  }

  const std::optional<AccountInfo> *CachedReads::account(
      const primitives::Address &address) const {
    auto it = accounts_.find(address);
    if (it == accounts_.end()) {
      return nullptr;
    }
    return &it->second;
  }

  std::optional<primitives::U256> CachedReads::storage(
      const primitives::Address &address, const common::Hash256 &slot) const {
    auto it = storage_.find(StorageKey{address, slot});
    if (it == storage_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  size_t CachedReads::size() const {
    return accounts_.size() + storage_.size();
  }

}  // namespace blockforge::state
