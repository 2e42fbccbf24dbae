/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "building/impl/filler_factory.hpp"

#include "common/outcome_throw.hpp"

namespace {
  constexpr uint64_t kTransferGas = 21000;
  constexpr uint64_t kGasHeadroom = 5000;
}  // namespace

namespace blockforge::building {

  FillerFactory::FillerFactory(crypto::Secp256k1Signer signer,
                               primitives::ChainId chain_id,
                               primitives::Nonce starting_nonce,
                               primitives::Address recipient,
                               primitives::U256 value)
      : signer_{std::move(signer)},
        chain_id_{chain_id},
        nonce_{starting_nonce},
        recipient_{std::move(recipient)},
        value_{std::move(value)} {}

  primitives::Gas FillerFactory::fillerGasLimit(
      const primitives::U256 &basefee) {
    return primitives::saturatingToU64(basefee * kTransferGas + kGasHeadroom);
  }

  primitives::SignedTransaction FillerFactory::next(
      const primitives::U256 &basefee) const {
    primitives::Eip1559Transaction tx{
        .chain_id = chain_id_,
        .nonce = nonce_,
        .max_priority_fee_per_gas = 0,
        .max_fee_per_gas = basefee,
        .gas_limit = fillerGasLimit(basefee),
        .to = recipient_,
        .value = value_,
        .input = {},
    };
    auto signed_tx = signer_.signTransaction(std::move(tx));
    if (not signed_tx) {
      common::raise(signed_tx.error());
    }
    return std::move(signed_tx.value());
  }

  void FillerFactory::advanceNonce() {
    ++nonce_;
  }

}  // namespace blockforge::building
