#include "crypto/secp256k1.hpp"
#include "crypto/keccak.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <algorithm>
#include <memory>

namespace canonical {

namespace {

struct BnDeleter { void operator()(BIGNUM* bn) const noexcept { BN_clear_free(bn); } };
struct BnCtxDeleter { void operator()(BN_CTX* ctx) const noexcept { BN_CTX_free(ctx); } };
struct GroupDeleter { void operator()(EC_GROUP* group) const noexcept { EC_GROUP_free(group); } };
struct PointDeleter { void operator()(EC_POINT* point) const noexcept { EC_POINT_free(point); } };

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;

constexpr int MAX_SIGN_ATTEMPTS = 16;

/// Per-call curve state. OpenSSL objects are not shared across threads.
struct Curve {
    GroupPtr group{EC_GROUP_new_by_curve_name(NID_secp256k1)};
    BnCtxPtr ctx{BN_CTX_new()};

    bool valid() const noexcept { return group && ctx; }
    const BIGNUM* order() const noexcept { return EC_GROUP_get0_order(group.get()); }

    PointPtr new_point() const { return PointPtr(EC_POINT_new(group.get())); }
};

BnPtr new_bn() {
    return BnPtr(BN_new());
}

BnPtr bn_from_bytes(const Bytes32& bytes) {
    return BnPtr(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr));
}

bool bn_to_bytes32(const BIGNUM* bn, Bytes32& out) {
    return BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) == static_cast<int>(out.size());
}

/// 0 < value < n
bool in_scalar_range(const BIGNUM* value, const BIGNUM* n) {
    return !BN_is_zero(value) && !BN_is_negative(value) && BN_cmp(value, n) < 0;
}

std::optional<Address> address_from_point(const Curve& curve, const EC_POINT* point) {
    uint8_t encoded[65];
    size_t len = EC_POINT_point2oct(curve.group.get(), point, POINT_CONVERSION_UNCOMPRESSED,
                                    encoded, sizeof(encoded), curve.ctx.get());
    if (len != sizeof(encoded)) return std::nullopt;

    Bytes32 digest = keccak256(std::span<const uint8_t>(encoded + 1, 64));
    Address address;
    std::copy(digest.begin() + 12, digest.end(), address.begin());
    return address;
}

} // anonymous namespace

std::optional<Address> ecrecover(const Bytes32& hash, uint8_t v, const Bytes32& r, const Bytes32& s) {
    if (v != 27 && v != 28) return std::nullopt;
    const int recovery_id = v - 27;

    Curve curve;
    if (!curve.valid()) return std::nullopt;
    const BIGNUM* n = curve.order();
    BN_CTX* ctx = curve.ctx.get();

    BnPtr r_bn = bn_from_bytes(r);
    BnPtr s_bn = bn_from_bytes(s);
    BnPtr e_raw = bn_from_bytes(hash);
    BnPtr e = new_bn();
    BnPtr zero = new_bn();
    BnPtr neg_e = new_bn();
    BnPtr u1 = new_bn();
    BnPtr u2 = new_bn();
    if (!r_bn || !s_bn || !e_raw || !e || !zero || !neg_e || !u1 || !u2) return std::nullopt;
    if (!in_scalar_range(r_bn.get(), n) || !in_scalar_range(s_bn.get(), n)) return std::nullopt;

    // R = point with x = r and the parity given by the recovery id
    PointPtr big_r = curve.new_point();
    if (!big_r) return std::nullopt;
    if (EC_POINT_set_compressed_coordinates(curve.group.get(), big_r.get(), r_bn.get(),
                                            recovery_id, ctx) != 1) {
        return std::nullopt;
    }

    // Q = r^-1 (s*R - e*G) = (-e * r^-1) G + (s * r^-1) R
    BnPtr r_inv(BN_mod_inverse(nullptr, r_bn.get(), n, ctx));
    if (!r_inv) return std::nullopt;
    BN_zero(zero.get());
    if (BN_nnmod(e.get(), e_raw.get(), n, ctx) != 1) return std::nullopt;
    if (BN_mod_sub(neg_e.get(), zero.get(), e.get(), n, ctx) != 1) return std::nullopt;
    if (BN_mod_mul(u1.get(), neg_e.get(), r_inv.get(), n, ctx) != 1) return std::nullopt;
    if (BN_mod_mul(u2.get(), s_bn.get(), r_inv.get(), n, ctx) != 1) return std::nullopt;

    PointPtr q = curve.new_point();
    if (!q) return std::nullopt;
    if (EC_POINT_mul(curve.group.get(), q.get(), u1.get(), big_r.get(), u2.get(), ctx) != 1) {
        return std::nullopt;
    }
    if (EC_POINT_is_at_infinity(curve.group.get(), q.get())) return std::nullopt;

    return address_from_point(curve, q.get());
}

std::optional<RecoverableSignature> sign_hash(const Bytes32& hash, const Bytes32& private_key) {
    Curve curve;
    if (!curve.valid()) return std::nullopt;
    const BIGNUM* n = curve.order();
    BN_CTX* ctx = curve.ctx.get();

    BnPtr d = bn_from_bytes(private_key);
    BnPtr e = bn_from_bytes(hash);
    BnPtr half_n = new_bn();
    BnPtr k = new_bn();
    BnPtr x = new_bn();
    BnPtr y = new_bn();
    BnPtr r = new_bn();
    BnPtr s = new_bn();
    BnPtr tmp = new_bn();
    if (!d || !e || !half_n || !k || !x || !y || !r || !s || !tmp) return std::nullopt;
    if (!in_scalar_range(d.get(), n)) return std::nullopt;
    if (BN_rshift1(half_n.get(), n) != 1) return std::nullopt;

    PointPtr big_r = curve.new_point();
    if (!big_r) return std::nullopt;

    for (int attempt = 0; attempt < MAX_SIGN_ATTEMPTS; ++attempt) {
        if (BN_priv_rand_range(k.get(), n) != 1) return std::nullopt;
        if (BN_is_zero(k.get())) continue;

        if (EC_POINT_mul(curve.group.get(), big_r.get(), k.get(), nullptr, nullptr, ctx) != 1) {
            return std::nullopt;
        }
        if (EC_POINT_get_affine_coordinates(curve.group.get(), big_r.get(), x.get(), y.get(), ctx) != 1) {
            return std::nullopt;
        }
        // x >= n would need a recovery id the v byte cannot carry
        if (BN_cmp(x.get(), n) >= 0) continue;
        if (BN_copy(r.get(), x.get()) == nullptr) return std::nullopt;
        if (BN_is_zero(r.get())) continue;
        int recovery_id = BN_is_odd(y.get()) ? 1 : 0;

        // s = k^-1 (e + r*d) mod n
        BnPtr k_inv(BN_mod_inverse(nullptr, k.get(), n, ctx));
        if (!k_inv) return std::nullopt;
        if (BN_mod_mul(tmp.get(), r.get(), d.get(), n, ctx) != 1) return std::nullopt;
        if (BN_mod_add(tmp.get(), tmp.get(), e.get(), n, ctx) != 1) return std::nullopt;
        if (BN_mod_mul(s.get(), k_inv.get(), tmp.get(), n, ctx) != 1) return std::nullopt;
        if (BN_is_zero(s.get())) continue;

        if (BN_cmp(s.get(), half_n.get()) > 0) {
            if (BN_sub(s.get(), n, s.get()) != 1) return std::nullopt;
            recovery_id ^= 1;
        }

        RecoverableSignature sig;
        if (!bn_to_bytes32(r.get(), sig.r) || !bn_to_bytes32(s.get(), sig.s)) return std::nullopt;
        sig.v = static_cast<uint8_t>(27 + recovery_id);
        return sig;
    }
    return std::nullopt;
}

std::optional<Address> address_from_private_key(const Bytes32& private_key) {
    Curve curve;
    if (!curve.valid()) return std::nullopt;

    BnPtr d = bn_from_bytes(private_key);
    if (!d || !in_scalar_range(d.get(), curve.order())) return std::nullopt;

    PointPtr q = curve.new_point();
    if (!q) return std::nullopt;
    if (EC_POINT_mul(curve.group.get(), q.get(), d.get(), nullptr, nullptr, curve.ctx.get()) != 1) {
        return std::nullopt;
    }
    return address_from_point(curve, q.get());
}

} // namespace canonical
