#pragma once

#include "trustflow/chain/hex.hpp"
#include "trustflow/chain/quantity.hpp"

#include <string>
#include <vector>

namespace trustflow {
namespace chain {
namespace rlp {

// -----------------------------------------------------------------------------
// Recursive Length Prefix encoding (encode side only)
// -----------------------------------------------------------------------------
// Each function returns a complete encoded item. Lists take items that are
// already encoded, so nested structures are built bottom-up:
//
//   rlp::list({rlp::quantity(nonce), rlp::bytes(to), rlp::list({})})
// -----------------------------------------------------------------------------
Bytes bytes(const Bytes& payload);
Bytes string(const std::string& payload);

// Integers are encoded big-endian without leading zeros; zero is the empty
// string (0x80).
Bytes quantity(Quantity value);

Bytes list(const std::vector<Bytes>& encoded_items);

}  // namespace rlp
}  // namespace chain
}  // namespace trustflow
