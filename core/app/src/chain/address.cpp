#include "trustflow/chain/address.hpp"
#include "trustflow/chain/keccak.hpp"

#include <cctype>
#include <stdexcept>

namespace trustflow {
namespace chain {

namespace {

std::string lowerDigits(const std::string& address) {
  std::string digits = stripHexPrefix(address);
  if (digits.size() != 40 || !isHexDigits(digits)) {
    throw std::invalid_argument("not a 20-byte hex address: " + address);
  }
  for (char& c : digits) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return digits;
}

}  // namespace

std::string toChecksumAddress(const std::string& address) {
  std::string digits = lowerDigits(address);
  Hash32 hash = keccak256(digits);

  std::string out = "0x";
  for (std::size_t i = 0; i < digits.size(); ++i) {
    char c = digits[i];
    std::uint8_t nib = (i % 2 == 0) ? (hash[i / 2] >> 4) : (hash[i / 2] & 0x0f);
    if (c >= 'a' && c <= 'f' && nib >= 8) {
      c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    out += c;
  }
  return out;
}

bool isAddressShape(const std::string& address) {
  return address.size() == 42 && address[0] == '0' &&
         (address[1] == 'x' || address[1] == 'X') &&
         isHexDigits(address.substr(2));
}

bool isValidAddress(const std::string& address) {
  if (!isAddressShape(address)) {
    return false;
  }
  std::string digits = address.substr(2);

  bool has_lower = false;
  bool has_upper = false;
  for (char c : digits) {
    if (c >= 'a' && c <= 'f') has_lower = true;
    if (c >= 'A' && c <= 'F') has_upper = true;
  }
  if (has_lower && has_upper) {
    return toChecksumAddress(address) == "0x" + digits;
  }
  return true;
}

Bytes addressBytes(const std::string& address) {
  return fromHex(lowerDigits(address));
}

bool sameAddress(const std::string& a, const std::string& b) {
  try {
    return lowerDigits(a) == lowerDigits(b);
  } catch (const std::invalid_argument&) {
    return a == b;
  }
}

}  // namespace chain
}  // namespace trustflow
