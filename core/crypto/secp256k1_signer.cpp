/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1_signer.hpp"

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include "codec/transaction_rlp.hpp"
#include "crypto/keccak.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(blockforge::crypto, SignerError, e) {
  using E = decltype(e);
  switch (e) {
    case E::INVALID_SECRET_KEY:
      return "Secret key is not a valid secp256k1 scalar";
    case E::SIGN_FAILED:
      return "Internal error during secp256k1 signing";
  }
  return "Unknown error in secp256k1 signer";
}

namespace blockforge::crypto {

  namespace {
    constexpr size_t kUncompressedPublicKeySize = 65;
    constexpr size_t kCompactSignatureSize = 64;
    constexpr size_t kAddressOffset = common::Hash256::size()
                                    - primitives::Address::size();

    std::shared_ptr<secp256k1_context> createContext() {
      return {secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                       | SECP256K1_CONTEXT_VERIFY),
              secp256k1_context_destroy};
    }
  }  // namespace

  Secp256k1Signer::Secp256k1Signer(
      std::shared_ptr<secp256k1_context_struct> context,
      Secp256k1SecretKey secret,
      primitives::Address address)
      : context_{std::move(context)},
        secret_{std::move(secret)},
        address_{std::move(address)} {}

  outcome::result<Secp256k1Signer> Secp256k1Signer::fromSecret(
      const Secp256k1SecretKey &secret) {
    auto context = createContext();

    if (secp256k1_ec_seckey_verify(context.get(), secret.data()) == 0) {
      return SignerError::INVALID_SECRET_KEY;
    }

    secp256k1_pubkey ffi_pub;
    if (secp256k1_ec_pubkey_create(context.get(), &ffi_pub, secret.data())
        == 0) {
      return SignerError::INVALID_SECRET_KEY;
    }

    std::array<uint8_t, kUncompressedPublicKeySize> serialized{};
    size_t size = serialized.size();
    if (secp256k1_ec_pubkey_serialize(context.get(),
                                      serialized.data(),
                                      &size,
                                      &ffi_pub,
                                      SECP256K1_EC_UNCOMPRESSED)
        == 0) {
      return SignerError::INVALID_SECRET_KEY;
    }

    // address is the tail of keccak256 over the key without the 0x04 tag
    auto pubkey_hash =
        keccak256(common::BufferView{serialized}.subspan(1, size - 1));
    primitives::Address address;
    std::copy(pubkey_hash.begin() + kAddressOffset,
              pubkey_hash.end(),
              address.begin());

    return Secp256k1Signer{std::move(context), secret, address};
  }

  outcome::result<Secp256k1Signer> Secp256k1Signer::fromHex(
      std::string_view hex) {
    OUTCOME_TRY(bytes, common::unhexMaybe0x(hex));
    OUTCOME_TRY(secret, Secp256k1SecretKey::fromSpan(bytes));
    return fromSecret(secret);
  }

  outcome::result<primitives::Signature> Secp256k1Signer::signPrehashed(
      const common::Hash256 &digest) const {
    secp256k1_ecdsa_recoverable_signature ffi_sig;
    if (secp256k1_ecdsa_sign_recoverable(context_.get(),
                                         &ffi_sig,
                                         digest.data(),
                                         secret_.data(),
                                         secp256k1_nonce_function_rfc6979,
                                         nullptr)
        == 0) {
      return SignerError::SIGN_FAILED;
    }

    std::array<uint8_t, kCompactSignatureSize> compact{};
    int recid = 0;
    if (secp256k1_ecdsa_recoverable_signature_serialize_compact(
            context_.get(), compact.data(), &recid, &ffi_sig)
        == 0) {
      return SignerError::SIGN_FAILED;
    }

    primitives::Signature sig;
    sig.y_parity = static_cast<uint8_t>(recid);
    auto half = compact.begin() + kCompactSignatureSize / 2;
    boost::multiprecision::import_bits(sig.r, compact.begin(), half);
    boost::multiprecision::import_bits(sig.s, half, compact.end());
    return sig;
  }

  outcome::result<primitives::SignedTransaction>
  Secp256k1Signer::signTransaction(primitives::Eip1559Transaction tx) const {
    auto digest = keccak256(codec::rlp::encodeTransactionForSigning(tx));
    OUTCOME_TRY(signature, signPrehashed(digest));
    auto hash =
        keccak256(codec::rlp::encodeSignedTransaction(tx, signature));
    return primitives::SignedTransaction{
        .transaction = std::move(tx),
        .signature = signature,
        .signer = address_,
        .hash = hash,
    };
  }

}  // namespace blockforge::crypto
