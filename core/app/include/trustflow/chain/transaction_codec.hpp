#pragma once

#include "trustflow/chain/chain_identity.hpp"
#include "trustflow/chain/chain_types.hpp"

#include <cstdint>

namespace trustflow {
namespace chain {

// A TxIntent with its nonce and chain id bound, ready to sign.
struct UnsignedTransaction {
  std::uint64_t chain_id{0};
  std::uint64_t nonce{0};
  TxIntent intent;
};

// -----------------------------------------------------------------------------
// Transaction encoding
// -----------------------------------------------------------------------------
//
// @brief  Serialises transactions in the two envelopes the ledger accepts.
//
// @details
//   Dynamic fee (EIP-1559, type 0x02):
//     payload   0x02 || rlp([chainId, nonce, maxPriorityFee, maxFee, gas,
//                            to, value, data, accessList])
//     signed    0x02 || rlp([... same nine fields ..., yParity, r, s])
//
//   Legacy with replay protection (EIP-155):
//     payload   rlp([nonce, gasPrice, gas, to, value, data, chainId, 0, 0])
//     signed    rlp([nonce, gasPrice, gas, to, value, data, v, r, s])
//               where v = recovery_id + chainId * 2 + 35
//
// The access list is always empty.
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------
Bytes signingPayload(const UnsignedTransaction& tx);

// keccak256(signingPayload(tx)).
Hash32 signingHash(const UnsignedTransaction& tx);

Bytes encodeSigned(const UnsignedTransaction& tx, const Signature& signature);

// keccak256 of the signed envelope: the hash the node reports back.
Hash32 transactionHash(const Bytes& signed_transaction);

}  // namespace chain
}  // namespace trustflow
