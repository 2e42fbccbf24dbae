/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/transaction_rlp.hpp"

#include "codec/rlp.hpp"

namespace blockforge::codec::rlp {

  namespace {
    std::vector<common::Buffer> payloadFields(
        const primitives::Eip1559Transaction &tx) {
      std::vector<common::Buffer> fields;
      fields.reserve(12);
      fields.emplace_back(encodeUint(tx.chain_id));
      fields.emplace_back(encodeUint(tx.nonce));
      fields.emplace_back(encodeUint(tx.max_priority_fee_per_gas));
      fields.emplace_back(encodeUint(tx.max_fee_per_gas));
      fields.emplace_back(encodeUint(tx.gas_limit));
      fields.emplace_back(tx.to ? encodeBytes(tx.to->view())
                                : encodeBytes(common::BufferView{}));
      fields.emplace_back(encodeUint(tx.value));
      fields.emplace_back(encodeBytes(tx.input));
      // empty access list
      fields.emplace_back(encodeList({}));
      return fields;
    }

    common::Buffer typedEnvelope(const common::Buffer &list) {
      common::Buffer out;
      out.reserve(list.size() + 1);
      out.push_back(primitives::kEip1559TxType);
      out.insert(out.end(), list.begin(), list.end());
      return out;
    }
  }  // namespace

  common::Buffer encodeTransactionForSigning(
      const primitives::Eip1559Transaction &tx) {
    return typedEnvelope(encodeList(payloadFields(tx)));
  }

  common::Buffer encodeSignedTransaction(
      const primitives::Eip1559Transaction &tx,
      const primitives::Signature &signature) {
    auto fields = payloadFields(tx);
    fields.emplace_back(encodeUint(uint64_t{signature.y_parity}));
    fields.emplace_back(encodeUint(signature.r));
    fields.emplace_back(encodeUint(signature.s));
    return typedEnvelope(encodeList(fields));
  }

}  // namespace blockforge::codec::rlp
