#include "trustflow/chain/hex.hpp"

#include <stdexcept>

namespace trustflow {
namespace chain {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

int nibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string toHex(const std::uint8_t* data, std::size_t size,
                  bool with_prefix) {
  std::string out;
  out.reserve(size * 2 + 2);
  if (with_prefix) {
    out += "0x";
  }
  for (std::size_t i = 0; i < size; ++i) {
    out += kDigits[data[i] >> 4];
    out += kDigits[data[i] & 0x0f];
  }
  return out;
}

std::string toHex(const Bytes& bytes, bool with_prefix) {
  return toHex(bytes.data(), bytes.size(), with_prefix);
}

std::string toHex(const Hash32& hash, bool with_prefix) {
  return toHex(hash.data(), hash.size(), with_prefix);
}

std::string stripHexPrefix(const std::string& hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    return hex.substr(2);
  }
  return hex;
}

bool isHexDigits(const std::string& s) {
  for (char c : s) {
    if (nibble(c) < 0) {
      return false;
    }
  }
  return true;
}

Bytes fromHex(const std::string& hex) {
  std::string digits = stripHexPrefix(hex);
  if (digits.size() % 2 != 0) {
    throw std::invalid_argument("odd-length hex string: " + hex);
  }

  Bytes out;
  out.reserve(digits.size() / 2);
  for (std::size_t i = 0; i < digits.size(); i += 2) {
    int hi = nibble(digits[i]);
    int lo = nibble(digits[i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("invalid hex string: " + hex);
    }
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

}  // namespace chain
}  // namespace trustflow
