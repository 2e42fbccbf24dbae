/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "crypto/secp256k1_signer.hpp"

namespace blockforge::application {

  /**
   * Settings of the filler builder algorithm
   */
  struct FillerBuilderConfig {
    /// profit is accounted as a payment to the proposer
    bool coinbase_payment{false};
    /// time allocated for executing transactions while building a block
    std::optional<uint64_t> build_duration_deadline_ms;
    /// hex encoded secret key of the filler sender, 0x prefix optional
    std::string filler_tx_private_key;
    /// wei transferred by every filler transaction
    uint64_t filler_tx_value{1};

    std::optional<std::chrono::milliseconds> buildDurationDeadline() const;

    outcome::result<crypto::Secp256k1Signer> fillerSigner() const;

    bool operator==(const FillerBuilderConfig &other) const = default;
  };

}  // namespace blockforge::application
