#include "trustflow/chain/keccak.hpp"

namespace trustflow {
namespace chain {

namespace {

constexpr std::size_t kRateBytes = 136;  // 1600 - 2 * 256 bits

constexpr std::uint64_t kRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL};

constexpr int kRotations[24] = {1,  3,  6,  10, 15, 21, 28, 36,
                                45, 55, 2,  14, 27, 41, 56, 8,
                                25, 43, 62, 18, 39, 61, 20, 44};

constexpr int kPiLanes[24] = {10, 7,  11, 17, 18, 3, 5,  16,
                              8,  21, 24, 4,  15, 23, 19, 13,
                              12, 2,  20, 14, 22, 9,  6,  1};

inline std::uint64_t rotl(std::uint64_t x, int n) {
  return (x << n) | (x >> (64 - n));
}

void keccakF1600(std::uint64_t st[25]) {
  std::uint64_t bc[5];

  for (int round = 0; round < 24; ++round) {
    // theta
    for (int i = 0; i < 5; ++i) {
      bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
    }
    for (int i = 0; i < 5; ++i) {
      std::uint64_t t = bc[(i + 4) % 5] ^ rotl(bc[(i + 1) % 5], 1);
      for (int j = 0; j < 25; j += 5) {
        st[j + i] ^= t;
      }
    }

    // rho + pi
    std::uint64_t t = st[1];
    for (int i = 0; i < 24; ++i) {
      int j = kPiLanes[i];
      std::uint64_t next = st[j];
      st[j] = rotl(t, kRotations[i]);
      t = next;
    }

    // chi
    for (int j = 0; j < 25; j += 5) {
      for (int i = 0; i < 5; ++i) {
        bc[i] = st[j + i];
      }
      for (int i = 0; i < 5; ++i) {
        st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
      }
    }

    // iota
    st[0] ^= kRoundConstants[round];
  }
}

// XORs one byte into the little-endian lane layout of the state.
inline void absorbByte(std::uint64_t st[25], std::size_t pos,
                       std::uint8_t byte) {
  st[pos / 8] ^= static_cast<std::uint64_t>(byte) << (8 * (pos % 8));
}

}  // namespace

Hash32 keccak256(const std::uint8_t* data, std::size_t size) {
  std::uint64_t st[25] = {};
  std::size_t pos = 0;

  for (std::size_t i = 0; i < size; ++i) {
    absorbByte(st, pos++, data[i]);
    if (pos == kRateBytes) {
      keccakF1600(st);
      pos = 0;
    }
  }

  absorbByte(st, pos, 0x01);
  absorbByte(st, kRateBytes - 1, 0x80);
  keccakF1600(st);

  Hash32 out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<std::uint8_t>(st[i / 8] >> (8 * (i % 8)));
  }
  return out;
}

Hash32 keccak256(const Bytes& data) {
  return keccak256(data.data(), data.size());
}

Hash32 keccak256(const std::string& data) {
  return keccak256(reinterpret_cast<const std::uint8_t*>(data.data()),
                   data.size());
}

}  // namespace chain
}  // namespace trustflow
