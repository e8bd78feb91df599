#pragma once

#include <map>
#include <string>

namespace trustflow {
namespace domain {

struct TokenInfo {
  std::string symbol;
  std::string name;
  std::string address;
  unsigned decimals{18};
};

// -----------------------------------------------------------------------------
// TokenRegistry
// -----------------------------------------------------------------------------
//
// @brief  Static symbol -> token table used to resolve order requests.
//
// @details
// withSepoliaDefaults() carries the two test-network tokens the service
// trades (WETH, 18 decimals; USDC, 6 decimals). resolve() accepts either
// a known symbol (case-insensitive) or a raw token address. Anything not
// in the table is passed through as an opaque address with 18 decimals;
// a bad value then fails when a transaction is built against it.
//
// Thread-safety: Immutable after construction.
// -----------------------------------------------------------------------------
class TokenRegistry {
 public:
  static TokenRegistry withSepoliaDefaults();

  void add(TokenInfo token);

  TokenInfo resolve(const std::string& symbol_or_address) const;

  // Decimals for a token address; 18 when the address is not registered.
  unsigned decimalsFor(const std::string& address) const;

 private:
  std::map<std::string, TokenInfo> by_symbol_;  // keyed by upper-case symbol
};

}  // namespace domain
}  // namespace trustflow
