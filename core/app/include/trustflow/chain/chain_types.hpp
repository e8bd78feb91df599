#pragma once

#include "trustflow/chain/hex.hpp"
#include "trustflow/chain/quantity.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace trustflow {
namespace chain {

// -----------------------------------------------------------------------------
// FeeQuote
// -----------------------------------------------------------------------------
// Per-gas price for a transaction, in wei. Either the dynamic-fee pair
// (EIP-1559) or a single legacy gas price. Ephemeral: taken immediately
// before building a transaction and never cached.
// -----------------------------------------------------------------------------
struct FeeQuote {
  enum class Kind { Eip1559, Legacy };

  Kind kind{Kind::Legacy};
  Quantity max_priority_fee_per_gas{0};
  Quantity max_fee_per_gas{0};
  Quantity gas_price{0};

  static FeeQuote eip1559(Quantity priority_fee, Quantity max_fee) {
    FeeQuote q;
    q.kind = Kind::Eip1559;
    q.max_priority_fee_per_gas = priority_fee;
    q.max_fee_per_gas = max_fee;
    return q;
  }

  static FeeQuote legacy(Quantity price) {
    FeeQuote q;
    q.kind = Kind::Legacy;
    q.gas_price = price;
    return q;
  }

  // Worst-case price per unit of gas, used for the balance pre-flight.
  Quantity pricePerGas() const {
    return kind == Kind::Eip1559 ? max_fee_per_gas : gas_price;
  }
};

// An unsigned transaction the service intends to send. The nonce actually
// signed is bound inside ChainClient::signAndBroadcast; nonce_hint is the
// counter value observed at build time, for logging only.
struct TxIntent {
  std::string label;
  std::string to;
  Bytes data;
  Quantity value{0};
  std::uint64_t gas_limit{0};
  FeeQuote fee;
  std::uint64_t nonce_hint{0};
};

// A transaction accepted by the node.
struct TransactionHandle {
  std::string tx_hash;
  std::uint64_t nonce{0};
  std::string raw_transaction;
  std::string label;
};

struct Receipt {
  std::string tx_hash;
  bool success{false};
  std::uint64_t block_number{0};
  std::uint64_t gas_used{0};
};

}  // namespace chain
}  // namespace trustflow
