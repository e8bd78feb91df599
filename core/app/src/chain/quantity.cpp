#include "trustflow/chain/quantity.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace trustflow {
namespace chain {

namespace {

constexpr Quantity kMax = ~static_cast<Quantity>(0);
constexpr unsigned kMaxDecimals = 36;
constexpr int kSignificantDigits = 15;

// value * base + digit, throwing instead of wrapping.
Quantity appendDigit(Quantity value, unsigned base, unsigned digit) {
  if (value > (kMax - digit) / base) {
    throw std::overflow_error("quantity exceeds 128 bits");
  }
  return value * base + digit;
}

int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

Quantity parseQuantity(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("empty quantity");
  }

  Quantity value = 0;
  if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    if (text.size() == 2) {
      throw std::invalid_argument("empty hex quantity: " + text);
    }
    for (std::size_t i = 2; i < text.size(); ++i) {
      int n = hexNibble(text[i]);
      if (n < 0) {
        throw std::invalid_argument("invalid hex quantity: " + text);
      }
      value = appendDigit(value, 16, static_cast<unsigned>(n));
    }
    return value;
  }

  for (char c : text) {
    if (c < '0' || c > '9') {
      throw std::invalid_argument("invalid decimal quantity: " + text);
    }
    value = appendDigit(value, 10, static_cast<unsigned>(c - '0'));
  }
  return value;
}

std::string toHexQuantity(Quantity value) {
  if (value == 0) {
    return "0x0";
  }
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  while (value != 0) {
    out += kDigits[static_cast<unsigned>(value & 0x0f)];
    value >>= 4;
  }
  std::reverse(out.begin(), out.end());
  return "0x" + out;
}

std::string toDecimalString(Quantity value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value != 0) {
    out += static_cast<char>('0' + static_cast<unsigned>(value % 10));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

Bytes toMinimalBigEndian(Quantity value) {
  Bytes out;
  while (value != 0) {
    out.push_back(static_cast<std::uint8_t>(value & 0xff));
    value >>= 8;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

Bytes toWord(Quantity value) {
  Bytes word(32, 0);
  for (std::size_t i = 0; i < 16; ++i) {
    word[31 - i] = static_cast<std::uint8_t>(value & 0xff);
    value >>= 8;
  }
  return word;
}

Quantity toBaseUnits(double amount, unsigned decimals) {
  if (!std::isfinite(amount) || amount < 0.0) {
    throw std::invalid_argument("amount must be a finite non-negative number");
  }
  if (decimals > kMaxDecimals) {
    throw std::invalid_argument("unsupported token decimals: " +
                                std::to_string(decimals));
  }

  // 15 significant digits survive the double round trip, so 0.1 scales to
  // exactly 10^(decimals-1). Digits below the token's precision truncate.
  char buf[40];
  const int len = std::snprintf(buf, sizeof(buf), "%.*e", kSignificantDigits - 1,
                                amount);
  if (len <= 0 || static_cast<std::size_t>(len) >= sizeof(buf)) {
    throw std::invalid_argument("cannot format amount");
  }
  const std::string text(buf, static_cast<std::size_t>(len));
  const std::size_t exp_pos = text.find('e');

  Quantity value = 0;
  for (std::size_t i = 0; i < exp_pos; ++i) {
    if (text[i] != '.') {
      value = value * 10 + static_cast<unsigned>(text[i] - '0');
    }
  }

  const int shift = std::stoi(text.substr(exp_pos + 1)) -
                    (kSignificantDigits - 1) + static_cast<int>(decimals);
  for (int i = 0; i < shift; ++i) {
    value = appendDigit(value, 10, 0);
  }
  for (int i = 0; i > shift && value != 0; --i) {
    value /= 10;
  }
  return value;
}

std::string formatUnits(Quantity value, unsigned decimals) {
  std::string digits = toDecimalString(value);
  if (decimals == 0) {
    return digits;
  }
  if (digits.size() <= decimals) {
    digits.insert(0, decimals - digits.size() + 1, '0');
  }
  std::string out = digits.substr(0, digits.size() - decimals) + "." +
                    digits.substr(digits.size() - decimals);
  while (out.back() == '0') {
    out.pop_back();
  }
  if (out.back() == '.') {
    out.pop_back();
  }
  return out;
}

}  // namespace chain
}  // namespace trustflow
