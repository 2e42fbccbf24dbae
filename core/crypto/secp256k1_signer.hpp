/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>

#include "primitives/transaction.hpp"

struct secp256k1_context_struct;

BLOCKFORGE_BLOB_STRICT_TYPEDEF(blockforge::crypto, Secp256k1SecretKey, 32);

namespace blockforge::crypto {

  enum class SignerError {
    INVALID_SECRET_KEY = 1,
    SIGN_FAILED,
  };

  /**
   * Ethereum account signer: holds a secp256k1 secret key, the address
   * derived from it, and produces recoverable signatures over keccak256
   * digests
   */
  class Secp256k1Signer {
   public:
    /**
     * @return signer for the key or INVALID_SECRET_KEY when the key is zero or
     * not below the curve order
     */
    static outcome::result<Secp256k1Signer> fromSecret(
        const Secp256k1SecretKey &secret);

    /**
     * Parses 32 hex encoded bytes, with or without the 0x prefix
     */
    static outcome::result<Secp256k1Signer> fromHex(std::string_view hex);

    const primitives::Address &address() const {
      return address_;
    }

    outcome::result<primitives::Signature> signPrehashed(
        const common::Hash256 &digest) const;

    /**
     * Signs the EIP-1559 payload and derives the transaction hash
     */
    outcome::result<primitives::SignedTransaction> signTransaction(
        primitives::Eip1559Transaction tx) const;

   private:
    Secp256k1Signer(std::shared_ptr<secp256k1_context_struct> context,
                    Secp256k1SecretKey secret,
                    primitives::Address address);

    std::shared_ptr<secp256k1_context_struct> context_;
    Secp256k1SecretKey secret_;
    primitives::Address address_;
  };

}  // namespace blockforge::crypto

OUTCOME_HPP_DECLARE_ERROR(blockforge::crypto, SignerError);
