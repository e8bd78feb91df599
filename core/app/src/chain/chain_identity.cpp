#include "trustflow/chain/chain_identity.hpp"
#include "trustflow/chain/address.hpp"
#include "trustflow/chain/keccak.hpp"
#include "trustflow/errors.hpp"

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <stdexcept>

namespace trustflow {
namespace chain {

// ---- OpenSSL handle ownership ----

namespace {

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};
struct GroupDeleter {
  void operator()(EC_GROUP* group) const { EC_GROUP_free(group); }
};
struct PointDeleter {
  void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

// Any OpenSSL primitive failing here means the library is unusable
// (allocation failure); there is no meaningful recovery.
void check(int ok, const char* what) {
  if (ok != 1) {
    throw std::runtime_error(std::string("OpenSSL failure: ") + what);
  }
}

template <typename T>
T* checkPtr(T* ptr, const char* what) {
  if (ptr == nullptr) {
    throw std::runtime_error(std::string("OpenSSL failure: ") + what);
  }
  return ptr;
}

BnPtr newBn() { return BnPtr(checkPtr(BN_new(), "BN_new")); }

BnPtr bnFromBytes(const std::uint8_t* data, std::size_t size) {
  return BnPtr(checkPtr(BN_bin2bn(data, static_cast<int>(size), nullptr),
                        "BN_bin2bn"));
}

Hash32 bnToWord(const BIGNUM* bn) {
  Hash32 out{};
  check(BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) ==
                static_cast<int>(out.size())
            ? 1
            : 0,
        "BN_bn2binpad");
  return out;
}

GroupPtr secp256k1() {
  return GroupPtr(checkPtr(EC_GROUP_new_by_curve_name(NID_secp256k1),
                           "EC_GROUP_new_by_curve_name(secp256k1)"));
}

using HmacKey = std::array<std::uint8_t, 32>;

// HMAC-SHA256(key, a || sep || b || c). sep < 0 means "no separator byte".
HmacKey hmac(const HmacKey& key, const HmacKey& a, int sep,
             const Hash32* b = nullptr, const Hash32* c = nullptr) {
  Bytes msg(a.begin(), a.end());
  if (sep >= 0) msg.push_back(static_cast<std::uint8_t>(sep));
  if (b != nullptr) msg.insert(msg.end(), b->begin(), b->end());
  if (c != nullptr) msg.insert(msg.end(), c->begin(), c->end());

  HmacKey out{};
  unsigned int out_len = 0;
  checkPtr(HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                msg.data(), msg.size(), out.data(), &out_len),
           "HMAC");
  OPENSSL_cleanse(msg.data(), msg.size());
  return out;
}

// RFC 6979 section 3.2 state for a 256-bit group order and SHA-256.
class NonceGenerator {
 public:
  NonceGenerator(const Hash32& private_key, const Hash32& reduced_digest) {
    v_.fill(0x01);
    k_.fill(0x00);
    k_ = hmac(k_, v_, 0x00, &private_key, &reduced_digest);
    v_ = hmac(k_, v_, -1);
    k_ = hmac(k_, v_, 0x01, &private_key, &reduced_digest);
    v_ = hmac(k_, v_, -1);
  }

  ~NonceGenerator() {
    OPENSSL_cleanse(k_.data(), k_.size());
    OPENSSL_cleanse(v_.data(), v_.size());
  }

  // Next candidate in [1, n-1].
  BnPtr next(const BIGNUM* order) {
    while (true) {
      if (primed_) {
        k_ = hmac(k_, v_, 0x00);
        v_ = hmac(k_, v_, -1);
      }
      primed_ = true;
      v_ = hmac(k_, v_, -1);
      BnPtr k = bnFromBytes(v_.data(), v_.size());
      if (!BN_is_zero(k.get()) && BN_cmp(k.get(), order) < 0) {
        return k;
      }
    }
  }

 private:
  HmacKey k_{};
  HmacKey v_{};
  bool primed_{false};
};

}  // namespace

// ---- KeyMaterial ----

struct ChainIdentity::KeyMaterial {
  Hash32 secret{};
  ~KeyMaterial() { OPENSSL_cleanse(secret.data(), secret.size()); }
};

// ---- Construction ----

ChainIdentity::ChainIdentity(std::unique_ptr<KeyMaterial> key,
                             std::string address)
    : key_(std::move(key)), address_(std::move(address)) {}

ChainIdentity::~ChainIdentity() = default;
ChainIdentity::ChainIdentity(ChainIdentity&& other) noexcept = default;
ChainIdentity& ChainIdentity::operator=(ChainIdentity&& other) noexcept =
    default;

ChainIdentity ChainIdentity::fromPrivateKeyHex(
    const std::string& private_key_hex) {
  std::string digits = stripHexPrefix(private_key_hex);
  if (digits.size() != 64 || !isHexDigits(digits)) {
    throw ConfigError("private key must be 32 bytes of hex");
  }

  auto key = std::make_unique<KeyMaterial>();
  Bytes raw = fromHex(digits);
  std::copy(raw.begin(), raw.end(), key->secret.begin());
  OPENSSL_cleanse(raw.data(), raw.size());
  OPENSSL_cleanse(&digits[0], digits.size());

  GroupPtr group = secp256k1();
  BnCtxPtr ctx(checkPtr(BN_CTX_new(), "BN_CTX_new"));
  BnPtr d = bnFromBytes(key->secret.data(), key->secret.size());
  if (BN_is_zero(d.get()) ||
      BN_cmp(d.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    throw ConfigError("private key is outside the secp256k1 scalar range");
  }

  PointPtr pub(checkPtr(EC_POINT_new(group.get()), "EC_POINT_new"));
  check(EC_POINT_mul(group.get(), pub.get(), d.get(), nullptr, nullptr,
                     ctx.get()),
        "EC_POINT_mul");

  std::array<std::uint8_t, 65> encoded{};
  std::size_t len =
      EC_POINT_point2oct(group.get(), pub.get(), POINT_CONVERSION_UNCOMPRESSED,
                         encoded.data(), encoded.size(), ctx.get());
  check(len == encoded.size() ? 1 : 0, "EC_POINT_point2oct");

  Hash32 hash = keccak256(encoded.data() + 1, encoded.size() - 1);
  std::string address = toChecksumAddress(toHex(hash.data() + 12, 20));

  return ChainIdentity(std::move(key), std::move(address));
}

// ---- sign ----

Signature ChainIdentity::sign(const Hash32& digest) const {
  GroupPtr group = secp256k1();
  BnCtxPtr ctx(checkPtr(BN_CTX_new(), "BN_CTX_new"));
  const BIGNUM* n = EC_GROUP_get0_order(group.get());

  BnPtr d = bnFromBytes(key_->secret.data(), key_->secret.size());

  // e = digest as an integer; h1 = e mod n for the nonce derivation.
  BnPtr e = bnFromBytes(digest.data(), digest.size());
  BnPtr e_mod = newBn();
  check(BN_nnmod(e_mod.get(), e.get(), n, ctx.get()), "BN_nnmod");
  Hash32 h1 = bnToWord(e_mod.get());

  BnPtr half_n = newBn();
  check(BN_rshift1(half_n.get(), n), "BN_rshift1");

  NonceGenerator nonces(key_->secret, h1);
  while (true) {
    BnPtr k = nonces.next(n);

    PointPtr point(checkPtr(EC_POINT_new(group.get()), "EC_POINT_new"));
    check(EC_POINT_mul(group.get(), point.get(), k.get(), nullptr, nullptr,
                       ctx.get()),
          "EC_POINT_mul");
    BnPtr x = newBn();
    BnPtr y = newBn();
    check(EC_POINT_get_affine_coordinates(group.get(), point.get(), x.get(),
                                          y.get(), ctx.get()),
          "EC_POINT_get_affine_coordinates");

    // R.x >= n cannot be expressed in a 0/1 recovery id.
    if (BN_cmp(x.get(), n) >= 0) continue;

    BnPtr r = newBn();
    check(BN_copy(r.get(), x.get()) != nullptr ? 1 : 0, "BN_copy");
    if (BN_is_zero(r.get())) continue;

    // s = k^-1 * (e + r * d) mod n
    BnPtr rd = newBn();
    check(BN_mod_mul(rd.get(), r.get(), d.get(), n, ctx.get()), "BN_mod_mul");
    BnPtr sum = newBn();
    check(BN_mod_add(sum.get(), e_mod.get(), rd.get(), n, ctx.get()),
          "BN_mod_add");
    BnPtr k_inv(checkPtr(BN_mod_inverse(nullptr, k.get(), n, ctx.get()),
                         "BN_mod_inverse"));
    BnPtr s = newBn();
    check(BN_mod_mul(s.get(), k_inv.get(), sum.get(), n, ctx.get()),
          "BN_mod_mul");
    if (BN_is_zero(s.get())) continue;

    int recovery_id = BN_is_odd(y.get()) ? 1 : 0;
    if (BN_cmp(s.get(), half_n.get()) > 0) {
      check(BN_sub(s.get(), n, s.get()), "BN_sub");
      recovery_id ^= 1;
    }

    Signature sig;
    sig.r = bnToWord(r.get());
    sig.s = bnToWord(s.get());
    sig.recovery_id = recovery_id;
    return sig;
  }
}

}  // namespace chain
}  // namespace trustflow
