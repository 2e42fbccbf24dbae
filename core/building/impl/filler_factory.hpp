/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1_signer.hpp"

namespace blockforge::building {

  /**
   * Produces self funded zero tip transfers from one account, used to fill
   * blocks when there is no real order flow
   */
  class FillerFactory {
   public:
    FillerFactory(crypto::Secp256k1Signer signer,
                  primitives::ChainId chain_id,
                  primitives::Nonce starting_nonce,
                  primitives::Address recipient,
                  primitives::U256 value);

    /**
     * Gas limit given to a filler at basefee: basefee * 21000 + 5000,
     * saturated to 64 bits. Not an estimate, only leaves enough headroom.
     */
    static primitives::Gas fillerGasLimit(const primitives::U256 &basefee);

    /**
     * Signs a filler with the current nonce, the nonce is not advanced.
     * Signing failure is raised as an exception.
     */
    primitives::SignedTransaction next(const primitives::U256 &basefee) const;

    /**
     * Must be called once for every transaction produced by next(), whether it
     * was included or not
     */
    void advanceNonce();

    primitives::Nonce nonce() const {
      return nonce_;
    }

    const primitives::Address &sender() const {
      return signer_.address();
    }

   private:
    crypto::Secp256k1Signer signer_;
    primitives::ChainId chain_id_;
    primitives::Nonce nonce_;
    primitives::Address recipient_;
    primitives::U256 value_;
  };

}  // namespace blockforge::building
