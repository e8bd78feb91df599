#pragma once

#include "trustflow/chain/i_rpc_transport.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace trustflow {
namespace chain {

// Result member of a decoded JSON-RPC 2.0 reply. A reply that is not an
// object, carries an "error" member, or has no "result" raises RpcError;
// the error object's code and message are used only when they have the
// types the protocol gives them.
nlohmann::json unwrapRpcReply(const std::string& method,
                              const nlohmann::json& reply);

// -----------------------------------------------------------------------------
// CurlRpcTransport
// -----------------------------------------------------------------------------
//
// @brief  JSON-RPC over HTTP(S) POST using libcurl.
//
// @details
// Each call() uses its own easy handle, so concurrent callers never share
// curl state. Request ids come from an atomic counter. curl_global_init
// runs once per process on first construction.
//
// Every failure, including HTTP status >= 400 and unparseable bodies, is
// reported as RpcError.
// -----------------------------------------------------------------------------

class CurlRpcTransport : public IRpcTransport {
 public:
  explicit CurlRpcTransport(std::string url, long timeout_ms = 15000);

  nlohmann::json call(const std::string& method,
                      const nlohmann::json& params) override;

  std::string endpoint() const override { return url_; }

 private:
  std::string url_;
  long timeout_ms_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace chain
}  // namespace trustflow
