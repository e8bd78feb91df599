#pragma once

#include "trustflow/chain/hex.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace trustflow {
namespace chain {

// -----------------------------------------------------------------------------
// AbiFunction
// -----------------------------------------------------------------------------
// A function entry resolved from a JSON ABI: its name and the canonical
// input types ("address", "uint256", ...).
// -----------------------------------------------------------------------------
struct AbiFunction {
  std::string name;
  std::vector<std::string> input_types;

  // Canonical signature, e.g. "approve(address,uint256)".
  std::string signature() const;

  // First four bytes of keccak256(signature()).
  Bytes selector() const;
};

// -----------------------------------------------------------------------------
// ABI call encoding
// -----------------------------------------------------------------------------
//
// @brief  Builds contract calldata from a JSON ABI, a function name, and a
//         JSON array of arguments.
//
// @details
// Supported parameter types:
//   address             hex string
//   bool                JSON boolean
//   uint<N> / int<N>    JSON integer, or decimal / 0x-hex string
//                       (negative values only for int<N>)
//   bytes<N>            hex string of at most N bytes, right-padded
//   string              UTF-8 text (dynamic)
//   bytes               hex string (dynamic)
//
// Arrays and tuples are not supported; encoding them raises AbiError, as
// does an unknown function, an argument count mismatch, or a value that
// does not fit its declared type.
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------
AbiFunction findFunction(const nlohmann::json& abi, const std::string& name,
                         std::size_t arg_count);

Bytes encodeArguments(const std::vector<std::string>& types,
                      const nlohmann::json& args);

Bytes encodeFunctionCall(const nlohmann::json& abi, const std::string& name,
                         const nlohmann::json& args);

}  // namespace chain
}  // namespace trustflow
