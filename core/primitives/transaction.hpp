/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/buffer.hpp"
#include "primitives/common.hpp"

namespace blockforge::primitives {

  /// Typed transaction envelope byte of EIP-1559 transactions
  constexpr uint8_t kEip1559TxType = 0x02;

  /**
   * Dynamic fee transaction payload. The access list is always empty for the
   * transactions produced here and is encoded as such.
   */
  struct Eip1559Transaction {
    ChainId chain_id{};
    Nonce nonce{};
    U256 max_priority_fee_per_gas{};
    U256 max_fee_per_gas{};
    Gas gas_limit{};
    /// std::nullopt means contract creation
    std::optional<Address> to;
    U256 value{};
    common::Buffer input;

    bool operator==(const Eip1559Transaction &other) const = default;
  };

  struct Signature {
    uint8_t y_parity{};
    U256 r{};
    U256 s{};

    bool operator==(const Signature &other) const = default;
  };

  /**
   * Transaction together with its signature and the values derived from it
   */
  struct SignedTransaction {
    Eip1559Transaction transaction;
    Signature signature;
    /// address recovered from the signature
    Address signer;
    /// keccak256 of the typed envelope
    Hash256 hash;

    bool operator==(const SignedTransaction &other) const = default;
  };

}  // namespace blockforge::primitives
