#include "crypto/typed_signature.hpp"
#include "crypto/keccak.hpp"
#include <algorithm>
#include <string_view>

namespace canonical {

namespace {

constexpr std::string_view PREFIX_DECIMAL = "\x19" "Ethereum Signed Message:\n32";
constexpr std::string_view PREFIX_HEXADECIMAL = "\x19" "Ethereum Signed Message:\n\x20";

constexpr size_t V_OFFSET = 64;
constexpr size_t TYPE_OFFSET = 65;

} // anonymous namespace

std::optional<TypedSignature> parse_typed_signature(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() != SIGNATURE_BYTES) return std::nullopt;
    if (bytes[TYPE_OFFSET] >= static_cast<uint8_t>(SignatureType::Invalid)) return std::nullopt;

    TypedSignature sig;
    std::copy(bytes.begin(), bytes.begin() + 32, sig.r.begin());
    std::copy(bytes.begin() + 32, bytes.begin() + 64, sig.s.begin());
    sig.v = bytes[V_OFFSET];
    sig.type = static_cast<SignatureType>(bytes[TYPE_OFFSET]);
    return sig;
}

SignatureBytes encode_typed_signature(const TypedSignature& signature) noexcept {
    SignatureBytes out{};
    std::copy(signature.r.begin(), signature.r.end(), out.begin());
    std::copy(signature.s.begin(), signature.s.end(), out.begin() + 32);
    out[V_OFFSET] = signature.v;
    out[TYPE_OFFSET] = static_cast<uint8_t>(signature.type);
    return out;
}

Bytes32 prepared_hash(const Bytes32& hash, SignatureType type) noexcept {
    Keccak256 hasher;
    switch (type) {
        case SignatureType::Decimal:
            hasher.update(PREFIX_DECIMAL);
            break;
        case SignatureType::Hexadecimal:
            hasher.update(PREFIX_HEXADECIMAL);
            break;
        default:
            return hash;
    }
    hasher.update(hash);
    return hasher.finalize();
}

std::optional<Address> recover_signer(const Bytes32& hash, std::span<const uint8_t> signature) {
    std::optional<TypedSignature> sig = parse_typed_signature(signature);
    if (!sig) return std::nullopt;
    return ecrecover(prepared_hash(hash, sig->type), sig->v, sig->r, sig->s);
}

std::optional<TypedSignature> sign_typed(const Bytes32& hash, const Bytes32& private_key,
                                         SignatureType type) {
    if (type == SignatureType::Invalid) return std::nullopt;

    std::optional<RecoverableSignature> raw = sign_hash(prepared_hash(hash, type), private_key);
    if (!raw) return std::nullopt;

    TypedSignature sig;
    sig.r = raw->r;
    sig.s = raw->s;
    sig.v = raw->v;
    sig.type = type;
    return sig;
}

} // namespace canonical
