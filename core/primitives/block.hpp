/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include "primitives/transaction.hpp"

namespace blockforge::primitives {

  struct BlockHeader {
    Hash256 parent_hash;
    Address beneficiary;
    Hash256 state_root;
    Hash256 transactions_root;
    Hash256 receipts_root;
    BlockNumber number{};
    Gas gas_limit{};
    Gas gas_used{};
    Timestamp timestamp{};
    U256 base_fee_per_gas{};
    std::optional<Gas> blob_gas_used;
    std::optional<Gas> excess_blob_gas;
    common::Buffer extra_data;

    bool operator==(const BlockHeader &other) const = default;
  };

  /**
   * @brief Block whose header was computed and hashed, ready for submission
   */
  struct SealedBlock {
    BlockHeader header;
    Hash256 hash;
    std::vector<SignedTransaction> body;

    bool operator==(const SealedBlock &other) const = default;
  };

  /**
   * Blobs carried by one blob transaction of a sealed block
   */
  struct BlobSidecar {
    Hash256 tx_hash;
    std::vector<common::Buffer> blobs;
    std::vector<common::Buffer> commitments;
    std::vector<common::Buffer> proofs;

    bool operator==(const BlobSidecar &other) const = default;
  };

}  // namespace blockforge::primitives
