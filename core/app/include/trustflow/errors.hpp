#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace trustflow {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Closed set of exception types raised by the service.
//
// @details
// Every failure the service reports derives from trustflow::Error, so an
// outer layer (IpcServer command dispatch, main()) can catch one base type
// and still report the concrete kind through typeName().
//
// Handling policy, per category:
//
//   Configuration   ConfigError, ChainUnavailable
//                   Fatal at construction. The component is never handed
//                   out half-built.
//
//   Network         RpcError
//                   Recovered locally where a fallback exists (fee
//                   estimation), otherwise propagated from the call.
//
//   On-chain        InsufficientFunds (pre-flight), BroadcastError,
//                   OnchainExecutionFailed (status-0 receipt),
//                   ContractUnavailable (sentinel contract address),
//                   AbiError (calldata could not be encoded)
//
//   Timeout         ConfirmationTimeout. The transaction may still land
//                   later; callers must treat the outcome as unknown.
//
//   Lookup          OrderNotFound, ProposalNotFound
//
//   Caller          InvalidTransition, InvalidOrderRequest
//
// OrderOrchestrator converts the on-chain and timeout categories into
// result records for approval and submission; they never escape those
// calls as exceptions.
// -----------------------------------------------------------------------------
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}

  // Stable machine-readable name used in IPC error replies.
  virtual const char* typeName() const noexcept { return "Error"; }
};

class ConfigError : public Error {
 public:
  using Error::Error;
  const char* typeName() const noexcept override { return "ConfigError"; }
};

class ChainUnavailable : public Error {
 public:
  using Error::Error;
  const char* typeName() const noexcept override { return "ChainUnavailable"; }
};

// JSON-RPC level failure: transport error, malformed reply, or an "error"
// object returned by the node. code is the node's error code when present.
class RpcError : public Error {
 public:
  explicit RpcError(const std::string& what, int code = 0)
      : Error(what), code_(code) {}
  const char* typeName() const noexcept override { return "RpcError"; }
  int code() const noexcept { return code_; }

 private:
  int code_;
};

class AbiError : public Error {
 public:
  using Error::Error;
  const char* typeName() const noexcept override { return "AbiError"; }
};

class InsufficientFunds : public Error {
 public:
  using Error::Error;
  const char* typeName() const noexcept override { return "InsufficientFunds"; }
};

class BroadcastError : public Error {
 public:
  using Error::Error;
  const char* typeName() const noexcept override { return "BroadcastError"; }
};

class ConfirmationTimeout : public Error {
 public:
  ConfirmationTimeout(const std::string& tx_hash, std::int64_t timeout_ms)
      : Error("no receipt for " + tx_hash + " within " +
              std::to_string(timeout_ms) +
              " ms; the transaction may still be mined later"),
        tx_hash_(tx_hash) {}
  const char* typeName() const noexcept override {
    return "ConfirmationTimeout";
  }
  const std::string& txHash() const noexcept { return tx_hash_; }

 private:
  std::string tx_hash_;
};

class OnchainExecutionFailed : public Error {
 public:
  OnchainExecutionFailed(const std::string& tx_hash, std::uint64_t block)
      : Error("transaction " + tx_hash + " reverted in block " +
              std::to_string(block)),
        tx_hash_(tx_hash) {}
  const char* typeName() const noexcept override {
    return "OnchainExecutionFailed";
  }
  const std::string& txHash() const noexcept { return tx_hash_; }

 private:
  std::string tx_hash_;
};

class ContractUnavailable : public Error {
 public:
  explicit ContractUnavailable(const std::string& address)
      : Error("order contract address is not configured (using " + address +
              ")") {}
  const char* typeName() const noexcept override {
    return "ContractUnavailable";
  }
};

class OrderNotFound : public Error {
 public:
  explicit OrderNotFound(std::uint64_t order_id)
      : Error("order " + std::to_string(order_id) + " not found") {}
  const char* typeName() const noexcept override { return "OrderNotFound"; }
};

class ProposalNotFound : public Error {
 public:
  explicit ProposalNotFound(const std::string& what) : Error(what) {}
  const char* typeName() const noexcept override { return "ProposalNotFound"; }
};

class InvalidTransition : public Error {
 public:
  using Error::Error;
  const char* typeName() const noexcept override {
    return "InvalidTransition";
  }
};

class InvalidOrderRequest : public Error {
 public:
  using Error::Error;
  const char* typeName() const noexcept override {
    return "InvalidOrderRequest";
  }
};

}  // namespace trustflow
