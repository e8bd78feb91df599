#include "trustflow/chain/rlp.hpp"

namespace trustflow {
namespace chain {
namespace rlp {

namespace {

// Short form: offset + length. Long form: (offset + 55) + length-of-length,
// followed by the big-endian length.
Bytes prefix(std::size_t length, std::uint8_t offset) {
  if (length <= 55) {
    return Bytes{static_cast<std::uint8_t>(offset + length)};
  }
  Bytes len_bytes = toMinimalBigEndian(static_cast<Quantity>(length));
  Bytes out{static_cast<std::uint8_t>(offset + 55 + len_bytes.size())};
  out.insert(out.end(), len_bytes.begin(), len_bytes.end());
  return out;
}

}  // namespace

Bytes bytes(const Bytes& payload) {
  if (payload.size() == 1 && payload[0] < 0x80) {
    return payload;
  }
  Bytes out = prefix(payload.size(), 0x80);
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

Bytes string(const std::string& payload) {
  return bytes(Bytes(payload.begin(), payload.end()));
}

Bytes quantity(Quantity value) { return bytes(toMinimalBigEndian(value)); }

Bytes list(const std::vector<Bytes>& encoded_items) {
  std::size_t total = 0;
  for (const auto& item : encoded_items) {
    total += item.size();
  }
  Bytes out = prefix(total, 0xc0);
  out.reserve(out.size() + total);
  for (const auto& item : encoded_items) {
    out.insert(out.end(), item.begin(), item.end());
  }
  return out;
}

}  // namespace rlp
}  // namespace chain
}  // namespace trustflow
