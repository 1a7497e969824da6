#include "orders/order_hasher.hpp"
#include "orders/order_codec.hpp"
#include "crypto/keccak.hpp"
#include "common/utils.hpp"

namespace canonical {

namespace {

constexpr uint8_t EIP191_HEADER[2] = {0x19, 0x01};

} // anonymous namespace

const Bytes32& OrderHasher::domain_schema_hash() {
    static const Bytes32 hash = keccak256(DOMAIN_SCHEMA);
    return hash;
}

const Bytes32& OrderHasher::order_schema_hash() {
    static const Bytes32 hash = keccak256(ORDER_SCHEMA);
    return hash;
}

OrderHasher::OrderHasher(const DomainConfig& domain) {
    // abi.encode(schemaHash, keccak(name), keccak(version), chainId, verifyingContract)
    uint8_t encoded[5 * WORD_BYTES] = {};
    Bytes32 name_hash = keccak256(std::string_view(domain.name));
    Bytes32 version_hash = keccak256(std::string_view(domain.version));

    std::copy(domain_schema_hash().begin(), domain_schema_hash().end(), encoded);
    std::copy(name_hash.begin(), name_hash.end(), encoded + WORD_BYTES);
    std::copy(version_hash.begin(), version_hash.end(), encoded + 2 * WORD_BYTES);
    store_word(domain.chain_id, encoded + 3 * WORD_BYTES);
    std::copy(domain.verifying_contract.begin(), domain.verifying_contract.end(),
              encoded + 5 * WORD_BYTES - sizeof(Address));

    domain_separator_ = keccak256(std::span<const uint8_t>(encoded, sizeof(encoded)));
}

Bytes32 OrderHasher::struct_hash(const Order& order) const {
    uint8_t encoded[WORD_BYTES + ORDER_STRUCT_BYTES];
    std::copy(order_schema_hash().begin(), order_schema_hash().end(), encoded);
    encode_order_words(order, encoded + WORD_BYTES);
    return keccak256(std::span<const uint8_t>(encoded, sizeof(encoded)));
}

OrderHash OrderHasher::hash_order(const Order& order) const {
    Keccak256 hasher;
    hasher.update(EIP191_HEADER);
    hasher.update(domain_separator_);
    hasher.update(struct_hash(order));
    return hasher.finalize();
}

} // namespace canonical
