#pragma once

#include "trustflow/chain/hex.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace trustflow {
namespace chain {

// -----------------------------------------------------------------------------
// keccak256
// -----------------------------------------------------------------------------
//
// @brief  Original Keccak-256 (0x01 domain padding), the digest the ledger
//         uses for transaction hashes, address derivation and ABI function
//         selectors.
//
// @details
// This is NOT FIPS-202 SHA3-256, which pads with 0x06 and produces a
// different digest for the same input. OpenSSL 3.0 only ships the FIPS
// variant, hence the local sponge.
//
// Thread-safety: Stateless; safe from any thread.
// -----------------------------------------------------------------------------
Hash32 keccak256(const std::uint8_t* data, std::size_t size);
Hash32 keccak256(const Bytes& data);
Hash32 keccak256(const std::string& data);

}  // namespace chain
}  // namespace trustflow
