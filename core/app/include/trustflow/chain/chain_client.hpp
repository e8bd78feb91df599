#pragma once

#include "trustflow/chain/chain_identity.hpp"
#include "trustflow/chain/i_chain_client.hpp"
#include "trustflow/chain/i_rpc_transport.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace trustflow {
namespace chain {

struct ChainClientOptions {
  // Tip offered on top of the base fee for dynamic-fee transactions.
  Quantity priority_fee{kGwei};
  // Last-resort legacy gas price when the node answers neither the block
  // nor the eth_gasPrice query.
  Quantity fallback_gas_price{20 * kGwei};
  // Receipt polling interval. Unset: 100 ms for loopback endpoints,
  // 5 s otherwise.
  std::optional<std::int64_t> poll_interval_ms;
  std::uint64_t approval_gas_limit{200000};
};

// -----------------------------------------------------------------------------
// ChainClient
// -----------------------------------------------------------------------------
//
// @brief  IChainClient over a JSON-RPC transport, signing locally with one
//         ChainIdentity.
//
// @details
// Construction is all-or-nothing:
//   - eth_chainId must answer, else ChainUnavailable.
//   - The nonce counter is seeded from eth_getTransactionCount(address,
//     "pending"), else ChainUnavailable.
//   - A missing or malformed contract address does not fail construction;
//     the client falls back to kSentinelAddress and hasUsableContract()
//     returns false.
//
// Nonce discipline:
//   signAndBroadcast binds the counter, signs, sends and increments inside
//   one critical section on nonce_mutex_. The counter only advances when
//   the node accepted the transaction, so a rejected broadcast leaves no
//   gap. The balance pre-flight runs before the lock is taken.
//
// Fee estimation:
//   latest block baseFeePerGas -> EIP-1559 quote (max = 2 * base + tip)
//   otherwise eth_gasPrice      -> legacy quote
//   otherwise                   -> legacy quote at fallback_gas_price
//
// Thread-safety:
//   All public methods may be called concurrently. awaitConfirmation does
//   not hold any lock while polling.
// -----------------------------------------------------------------------------
class ChainClient : public IChainClient {
 public:
  ChainClient(std::unique_ptr<IRpcTransport> transport, ChainIdentity identity,
              const std::string& contract_address,
              ChainClientOptions options = {});

  ChainClient(const ChainClient&) = delete;
  ChainClient& operator=(const ChainClient&) = delete;

  std::string address() const override { return identity_.address(); }
  std::string contractAddress() const override { return contract_address_; }
  bool hasUsableContract() const override { return contract_usable_; }

  FeeQuote estimateFees() override;

  TxIntent buildApprovalTransaction(const std::string& token,
                                    const std::string& spender,
                                    Quantity amount) override;

  TxIntent buildGenericCallTransaction(const std::string& contract,
                                       const nlohmann::json& abi,
                                       const std::string& function,
                                       const nlohmann::json& args,
                                       Quantity value,
                                       std::uint64_t gas_limit) override;

  TransactionHandle signAndBroadcast(const TxIntent& intent) override;

  Receipt awaitConfirmation(const TransactionHandle& handle,
                            std::int64_t timeout_ms) override;

  std::uint64_t chainId() const noexcept { return chain_id_; }

  // Current balance of the signing address, in wei. Throws RpcError.
  Quantity balance();

  // Nonce the next successful broadcast will use.
  std::uint64_t nextNonce() const;

  std::int64_t pollIntervalMs() const noexcept { return poll_interval_ms_; }

 private:
  // call() with quantity parsing; a malformed quantity becomes RpcError.
  Quantity callQuantity(const std::string& method,
                        const nlohmann::json& params);

  std::unique_ptr<IRpcTransport> transport_;
  ChainIdentity identity_;
  ChainClientOptions options_;
  std::string contract_address_;
  bool contract_usable_{false};
  std::uint64_t chain_id_{0};
  std::int64_t poll_interval_ms_{5000};

  mutable std::mutex nonce_mutex_;
  std::uint64_t next_nonce_{0};
};

}  // namespace chain
}  // namespace trustflow
