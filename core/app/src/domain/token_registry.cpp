#include "trustflow/domain/token_registry.hpp"
#include "trustflow/chain/address.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace trustflow {
namespace domain {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

}  // namespace

TokenRegistry TokenRegistry::withSepoliaDefaults() {
  TokenRegistry registry;
  registry.add({"WETH", "Wrapped Ether",
                "0xfFF9976782D46CC05630D1f6EB9BC98210FBfcc5", 18});
  registry.add({"USDC", "USD Coin",
                "0x56AD9fB23C8A0B2c9030a9086A0f174a7d4E708e", 6});
  return registry;
}

void TokenRegistry::add(TokenInfo token) {
  if (chain::isAddressShape(token.address)) {
    token.address = chain::toChecksumAddress(token.address);
  }
  std::string key = upper(token.symbol);
  by_symbol_[key] = std::move(token);
}

TokenInfo TokenRegistry::resolve(const std::string& symbol_or_address) const {
  auto it = by_symbol_.find(upper(symbol_or_address));
  if (it != by_symbol_.end()) {
    return it->second;
  }

  // Addresses are matched and normalised whatever their letter case.
  const bool is_address = chain::isAddressShape(symbol_or_address);
  if (is_address) {
    for (const auto& entry : by_symbol_) {
      if (chain::sameAddress(entry.second.address, symbol_or_address)) {
        return entry.second;
      }
    }
  }

  TokenInfo opaque;
  opaque.address = is_address ? chain::toChecksumAddress(symbol_or_address)
                              : symbol_or_address;
  opaque.symbol = symbol_or_address;
  opaque.name = symbol_or_address;
  opaque.decimals = 18;
  return opaque;
}

unsigned TokenRegistry::decimalsFor(const std::string& address) const {
  for (const auto& entry : by_symbol_) {
    if (chain::sameAddress(entry.second.address, address)) {
      return entry.second.decimals;
    }
  }
  return 18;
}

}  // namespace domain
}  // namespace trustflow
