#pragma once

#include "common/types.hpp"
#include <optional>

namespace canonical {

/// Compact ECDSA signature with Ethereum recovery byte (v = 27 or 28).
struct RecoverableSignature {
    Bytes32 r{};
    Bytes32 s{};
    uint8_t v = 0;
};

/// secp256k1 public key recovery over a 32-byte message hash, yielding the
/// signer address (last 20 bytes of keccak256 of the uncompressed key).
/// Returns nullopt when v is not 27/28, r or s is outside [1, n), or no valid
/// point can be recovered.
std::optional<Address> ecrecover(const Bytes32& hash, uint8_t v, const Bytes32& r, const Bytes32& s);

/// Sign a message hash with a raw private key. Produces low-s signatures.
/// Returns nullopt when the key is outside [1, n).
std::optional<RecoverableSignature> sign_hash(const Bytes32& hash, const Bytes32& private_key);

std::optional<Address> address_from_private_key(const Bytes32& private_key);

} // namespace canonical
