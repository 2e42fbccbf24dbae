/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "primitives/transaction.hpp"

namespace blockforge::codec::rlp {

  /**
   * Typed envelope whose keccak256 is signed:
   * 0x02 || rlp([chain_id, nonce, max_priority_fee_per_gas, max_fee_per_gas,
   *              gas_limit, to, value, input, access_list])
   */
  common::Buffer encodeTransactionForSigning(
      const primitives::Eip1559Transaction &tx);

  /**
   * Network form of a signed transaction, the same list followed by
   * y_parity, r and s. Its keccak256 is the transaction hash.
   */
  common::Buffer encodeSignedTransaction(
      const primitives::Eip1559Transaction &tx,
      const primitives::Signature &signature);

}  // namespace blockforge::codec::rlp
