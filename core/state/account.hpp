/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/common.hpp"

namespace blockforge::state {

  struct AccountInfo {
    primitives::U256 balance{};
    primitives::Nonce nonce{};
    common::Hash256 code_hash;

    bool operator==(const AccountInfo &other) const = default;
  };

  struct StorageKey {
    primitives::Address address;
    common::Hash256 slot;

    bool operator==(const StorageKey &other) const = default;
  };

}  // namespace blockforge::state

template <>
struct std::hash<blockforge::state::StorageKey> {
  auto operator()(const blockforge::state::StorageKey &key) const {
    size_t seed = std::hash<blockforge::primitives::Address>{}(key.address);
    boost::hash_combine(seed, std::hash<blockforge::common::Hash256>{}(key.slot));
    return seed;
  }
};
