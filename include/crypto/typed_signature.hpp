#pragma once

#include "common/types.hpp"
#include "crypto/secp256k1.hpp"
#include <array>
#include <optional>
#include <span>

namespace canonical {

/// How the signed message hash was derived from the order hash.
enum class SignatureType : uint8_t {
    NoPrepend = 0,      // hash signed directly
    Decimal = 1,        // "\x19Ethereum Signed Message:\n32" ++ hash
    Hexadecimal = 2,    // "\x19Ethereum Signed Message:\n\x20" ++ hash
    Invalid = 3
};

/// 66-byte detached signature: r[0..32) s[32..64) v[64] type[65].
struct TypedSignature {
    Bytes32 r{};
    Bytes32 s{};
    uint8_t v = 0;
    SignatureType type = SignatureType::NoPrepend;
};

using SignatureBytes = std::array<uint8_t, SIGNATURE_BYTES>;

/// Fixed-offset extraction. Fails on wrong length or unknown type byte.
std::optional<TypedSignature> parse_typed_signature(std::span<const uint8_t> bytes) noexcept;

SignatureBytes encode_typed_signature(const TypedSignature& signature) noexcept;

/// Message hash actually fed to ecrecover for the given signature type.
Bytes32 prepared_hash(const Bytes32& hash, SignatureType type) noexcept;

/// Signer of `hash` under a detached signature, or nullopt if the bytes are
/// malformed or recovery fails.
std::optional<Address> recover_signer(const Bytes32& hash, std::span<const uint8_t> signature);

/// Produce a typed signature over `hash` (used by tooling and tests).
std::optional<TypedSignature> sign_typed(const Bytes32& hash, const Bytes32& private_key,
                                         SignatureType type = SignatureType::NoPrepend);

} // namespace canonical
