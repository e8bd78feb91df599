#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace trustflow {
namespace chain {

// -----------------------------------------------------------------------------
// IRpcTransport
// -----------------------------------------------------------------------------
//
// @brief  One JSON-RPC 2.0 request/response exchange with a ledger node.
//
// @details
// call() returns the "result" member of the reply. Transport failures,
// malformed replies and node-reported "error" objects all surface as
// RpcError. Implementations must be safe to call from several threads at
// once; ChainClient polls receipts outside its nonce lock.
//
// CurlRpcTransport is the production implementation; tests script replies
// through a fake.
// -----------------------------------------------------------------------------
class IRpcTransport {
 public:
  virtual ~IRpcTransport() = default;

  virtual nlohmann::json call(const std::string& method,
                              const nlohmann::json& params) = 0;

  // Endpoint URL, used to pick the receipt polling interval.
  virtual std::string endpoint() const = 0;
};

}  // namespace chain
}  // namespace trustflow
