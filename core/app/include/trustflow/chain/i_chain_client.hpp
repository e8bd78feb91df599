#pragma once

#include "trustflow/chain/chain_types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace trustflow {
namespace chain {

// -----------------------------------------------------------------------------
// IChainClient — transaction submission primitive
// -----------------------------------------------------------------------------
//
// @brief  Everything the order workflow needs from the ledger: fee quotes,
//         transaction building, nonce-sequenced broadcast and confirmation.
//
// @details
// OrderOrchestrator depends only on this interface. ChainClient is the
// JSON-RPC implementation; the orchestrator tests substitute a scripted
// fake so scenarios run without a node.
//
// Error contract (all types from trustflow/errors.hpp):
//   estimateFees           never throws; degrades through fallbacks.
//   build*Transaction      AbiError for calldata that cannot be encoded.
//   signAndBroadcast       InsufficientFunds (before the nonce is touched),
//                          BroadcastError (node rejected the transaction,
//                          nonce not consumed), RpcError.
//   awaitConfirmation      ConfirmationTimeout, OnchainExecutionFailed.
//
// None of these failures poison the client; the next call proceeds
// normally.
//
// Ownership:
//   ServiceContext owns the client via unique_ptr<IChainClient>.
//   OrderOrchestrator holds a reference.
//
// Thread-safety:
//   Implementations must accept concurrent callers. Broadcasts are
//   serialised on the nonce counter; confirmation waits are not.
// -----------------------------------------------------------------------------
class IChainClient {
 public:
  virtual ~IChainClient() = default;

  // Checksummed address of the signing identity.
  virtual std::string address() const = 0;

  // Order contract address, or the sentinel when none was configured.
  virtual std::string contractAddress() const = 0;

  // False when contractAddress() is the sentinel.
  virtual bool hasUsableContract() const = 0;

  virtual FeeQuote estimateFees() = 0;

  // ERC-20 approve(spender, amount) on `token`, gas budget 200000.
  virtual TxIntent buildApprovalTransaction(const std::string& token,
                                            const std::string& spender,
                                            Quantity amount) = 0;

  // Arbitrary call of `function` on `contract`, encoded against the JSON
  // ABI with `args` (a JSON array).
  virtual TxIntent buildGenericCallTransaction(const std::string& contract,
                                               const nlohmann::json& abi,
                                               const std::string& function,
                                               const nlohmann::json& args,
                                               Quantity value,
                                               std::uint64_t gas_limit) = 0;

  virtual TransactionHandle signAndBroadcast(const TxIntent& intent) = 0;

  // Blocks until a receipt is available or `timeout_ms` has elapsed.
  virtual Receipt awaitConfirmation(const TransactionHandle& handle,
                                    std::int64_t timeout_ms) = 0;
};

}  // namespace chain
}  // namespace trustflow
