#pragma once

#include "trustflow/chain/hex.hpp"

#include <memory>
#include <string>

namespace trustflow {
namespace chain {

// Recoverable secp256k1 signature. recovery_id is 0 or 1 (the parity of
// the ephemeral point's y coordinate after low-s normalisation).
struct Signature {
  Hash32 r{};
  Hash32 s{};
  int recovery_id{0};
};

// -----------------------------------------------------------------------------
// ChainIdentity
// -----------------------------------------------------------------------------
//
// @brief  The signing identity of the service: one secp256k1 private key
//         and the ledger address derived from it.
//
// @details
// The address is keccak256 of the 64-byte uncompressed public key (without
// the 0x04 tag), last 20 bytes, spelled with the EIP-55 checksum.
//
// sign() produces deterministic signatures (RFC 6979 nonces over
// HMAC-SHA256), normalised to the lower half of the curve order as the
// ledger requires. Signing the same digest twice yields the same bytes.
//
// Ownership:
//   The key bytes live in a private heap block that is wiped with
//   OPENSSL_cleanse on destruction. The type is move-only. The key is
//   never logged or returned.
//
// Thread-safety:
//   Immutable after construction; sign() and address() are safe from any
//   thread.
// -----------------------------------------------------------------------------
class ChainIdentity {
 public:
  // Accepts 64 hex digits with or without "0x". Throws ConfigError when the
  // text is malformed or the scalar is outside [1, n-1].
  static ChainIdentity fromPrivateKeyHex(const std::string& private_key_hex);

  ~ChainIdentity();
  ChainIdentity(ChainIdentity&& other) noexcept;
  ChainIdentity& operator=(ChainIdentity&& other) noexcept;

  ChainIdentity(const ChainIdentity&) = delete;
  ChainIdentity& operator=(const ChainIdentity&) = delete;

  const std::string& address() const noexcept { return address_; }

  Signature sign(const Hash32& digest) const;

 private:
  struct KeyMaterial;

  ChainIdentity(std::unique_ptr<KeyMaterial> key, std::string address);

  std::unique_ptr<KeyMaterial> key_;
  std::string address_;
};

}  // namespace chain
}  // namespace trustflow
