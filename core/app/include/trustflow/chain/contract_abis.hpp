#pragma once

#include <nlohmann/json.hpp>

namespace trustflow {
namespace chain {

// ERC-20 subset the service calls or may inspect.
inline const nlohmann::json& erc20Abi() {
  static const nlohmann::json abi = nlohmann::json::parse(R"([
    {
      "type": "function",
      "name": "approve",
      "stateMutability": "nonpayable",
      "inputs": [
        {"name": "_spender", "type": "address"},
        {"name": "_value", "type": "uint256"}
      ],
      "outputs": [{"name": "", "type": "bool"}]
    },
    {
      "type": "function",
      "name": "decimals",
      "stateMutability": "view",
      "inputs": [],
      "outputs": [{"name": "", "type": "uint8"}]
    },
    {
      "type": "function",
      "name": "symbol",
      "stateMutability": "view",
      "inputs": [],
      "outputs": [{"name": "", "type": "string"}]
    }
  ])");
  return abi;
}

// The limit-order contract the service submits to.
inline const nlohmann::json& limitOrderContractAbi() {
  static const nlohmann::json abi = nlohmann::json::parse(R"([
    {
      "type": "function",
      "name": "submitLimitOrder",
      "stateMutability": "nonpayable",
      "inputs": [
        {"name": "fromToken", "type": "address"},
        {"name": "toToken", "type": "address"},
        {"name": "amount", "type": "uint256"},
        {"name": "price", "type": "uint256"},
        {"name": "maker", "type": "address"}
      ],
      "outputs": []
    }
  ])");
  return abi;
}

}  // namespace chain
}  // namespace trustflow
