#include "trustflow/chain/transaction_codec.hpp"
#include "trustflow/chain/address.hpp"
#include "trustflow/chain/keccak.hpp"
#include "trustflow/chain/rlp.hpp"

#include <vector>

namespace trustflow {
namespace chain {

namespace {

constexpr std::uint8_t kDynamicFeeTxType = 0x02;

// Signature scalars go on the wire without leading zeros.
Bytes scalar(const Hash32& word) {
  std::size_t first = 0;
  while (first < word.size() && word[first] == 0) ++first;
  return rlp::bytes(Bytes(word.begin() + first, word.end()));
}

// Fields shared by the unsigned and signed dynamic-fee forms.
std::vector<Bytes> dynamicFeeFields(const UnsignedTransaction& tx) {
  const TxIntent& in = tx.intent;
  return {
      rlp::quantity(tx.chain_id),
      rlp::quantity(tx.nonce),
      rlp::quantity(in.fee.max_priority_fee_per_gas),
      rlp::quantity(in.fee.max_fee_per_gas),
      rlp::quantity(in.gas_limit),
      rlp::bytes(addressBytes(in.to)),
      rlp::quantity(in.value),
      rlp::bytes(in.data),
      rlp::list({}),
  };
}

std::vector<Bytes> legacyFields(const UnsignedTransaction& tx) {
  const TxIntent& in = tx.intent;
  return {
      rlp::quantity(tx.nonce),
      rlp::quantity(in.fee.gas_price),
      rlp::quantity(in.gas_limit),
      rlp::bytes(addressBytes(in.to)),
      rlp::quantity(in.value),
      rlp::bytes(in.data),
  };
}

Bytes typed(std::uint8_t type, const Bytes& body) {
  Bytes out{type};
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

}  // namespace

Bytes signingPayload(const UnsignedTransaction& tx) {
  if (tx.intent.fee.kind == FeeQuote::Kind::Eip1559) {
    return typed(kDynamicFeeTxType, rlp::list(dynamicFeeFields(tx)));
  }
  std::vector<Bytes> fields = legacyFields(tx);
  fields.push_back(rlp::quantity(tx.chain_id));
  fields.push_back(rlp::quantity(0));
  fields.push_back(rlp::quantity(0));
  return rlp::list(fields);
}

Hash32 signingHash(const UnsignedTransaction& tx) {
  return keccak256(signingPayload(tx));
}

Bytes encodeSigned(const UnsignedTransaction& tx, const Signature& signature) {
  if (tx.intent.fee.kind == FeeQuote::Kind::Eip1559) {
    std::vector<Bytes> fields = dynamicFeeFields(tx);
    fields.push_back(rlp::quantity(static_cast<Quantity>(signature.recovery_id)));
    fields.push_back(scalar(signature.r));
    fields.push_back(scalar(signature.s));
    return typed(kDynamicFeeTxType, rlp::list(fields));
  }
  std::vector<Bytes> fields = legacyFields(tx);
  Quantity v = static_cast<Quantity>(signature.recovery_id) +
               static_cast<Quantity>(tx.chain_id) * 2 + 35;
  fields.push_back(rlp::quantity(v));
  fields.push_back(scalar(signature.r));
  fields.push_back(scalar(signature.s));
  return rlp::list(fields);
}

Hash32 transactionHash(const Bytes& signed_transaction) {
  return keccak256(signed_transaction);
}

}  // namespace chain
}  // namespace trustflow
