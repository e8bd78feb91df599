#pragma once

#include "trustflow/chain/hex.hpp"

#include <string>

namespace trustflow {
namespace chain {

// Placeholder contract address used when the configured order contract is
// missing or malformed. Nothing is ever sent to it.
constexpr const char* kSentinelAddress =
    "0x000000000000000000000000000000000000dEaD";

// "0x" + 40 hex digits in any case; the checksum is not looked at.
bool isAddressShape(const std::string& address);

// "0x" + 40 hex digits. All-lower and all-upper spellings are accepted;
// mixed case must match the EIP-55 checksum.
bool isValidAddress(const std::string& address);

// EIP-55 mixed-case checksum spelling. Throws std::invalid_argument if the
// input is not 40 hex digits (with or without "0x").
std::string toChecksumAddress(const std::string& address);

// Raw 20 bytes of a valid address.
Bytes addressBytes(const std::string& address);

bool sameAddress(const std::string& a, const std::string& b);

}  // namespace chain
}  // namespace trustflow
