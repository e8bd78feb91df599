#pragma once

#include "trustflow/chain/hex.hpp"

#include <string>

namespace trustflow {
namespace chain {

// -----------------------------------------------------------------------------
// Quantity
// -----------------------------------------------------------------------------
//
// @brief  Unsigned 128-bit integer used for wei amounts, gas prices and
//         token base units.
//
// @details
// 2^128 is roughly 3.4e38, which covers any realistic account balance in
// wei and any token amount scaled by up to 18 decimals. ABI uint256 words
// are written by zero-extending to 32 bytes. Values beyond 128 bits are
// rejected at parse time with std::overflow_error.
// -----------------------------------------------------------------------------
using Quantity = unsigned __int128;

constexpr Quantity kGwei = 1000000000ULL;

// Parses a JSON-RPC hex quantity ("0x1a") or a plain decimal string.
// Throws std::invalid_argument on malformed input, std::overflow_error when
// the value does not fit.
Quantity parseQuantity(const std::string& text);

// "0x0", "0x1a" ... (JSON-RPC quantity encoding, no leading zeros).
std::string toHexQuantity(Quantity value);

std::string toDecimalString(Quantity value);

// Minimal big-endian byte form (empty for zero), as RLP expects.
Bytes toMinimalBigEndian(Quantity value);

// Zero-extended 32-byte big-endian word, as the ABI expects.
Bytes toWord(Quantity value);

// Scales a human-unit decimal amount to integer base units, e.g.
// toBaseUnits(0.01, 18) == 10^16. The amount is read at 15 significant
// digits, so 0.01 does not turn into 9999999999999999; digits finer than
// `decimals` are truncated. Throws std::invalid_argument for negative or
// non-finite input, std::overflow_error past 128 bits.
Quantity toBaseUnits(double amount, unsigned decimals);

// Inverse of toBaseUnits for log output, e.g. formatUnits(10^16, 18) ==
// "0.01".
std::string formatUnits(Quantity value, unsigned decimals);

}  // namespace chain
}  // namespace trustflow
