#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace trustflow {
namespace chain {

using Bytes = std::vector<std::uint8_t>;
using Hash32 = std::array<std::uint8_t, 32>;

// -----------------------------------------------------------------------------
// Hex helpers
// -----------------------------------------------------------------------------
// Lower-case hex encoding with an optional "0x" prefix, and a decoder that
// accepts either form. fromHex() throws std::invalid_argument on odd length
// or non-hex characters.
// -----------------------------------------------------------------------------
std::string toHex(const std::uint8_t* data, std::size_t size,
                  bool with_prefix = true);
std::string toHex(const Bytes& bytes, bool with_prefix = true);
std::string toHex(const Hash32& hash, bool with_prefix = true);

Bytes fromHex(const std::string& hex);

// Strips a leading "0x" / "0X" if present.
std::string stripHexPrefix(const std::string& hex);

bool isHexDigits(const std::string& s);

}  // namespace chain
}  // namespace trustflow
