#pragma once

#include "common/types.hpp"
#include "common/config.hpp"
#include <string_view>

namespace canonical {

/// EIP-712 typed-structured-data hashing of canonical orders.
///
/// order_hash = keccak256(0x19 0x01 ++ domain_separator ++ struct_hash(order))
/// struct_hash = keccak256(ORDER_SCHEMA_HASH ++ abi_encode(order))
///
/// The domain separator binds hashes to one protocol name, version, chain and
/// verifying contract; it is computed once at construction.
class OrderHasher {
public:
    static constexpr std::string_view DOMAIN_SCHEMA =
        "EIP712Domain("
        "string name,"
        "string version,"
        "uint256 chainId,"
        "address verifyingContract"
        ")";

    static constexpr std::string_view ORDER_SCHEMA =
        "CanonicalOrder("
        "bytes32 flags,"
        "uint256 baseMarket,"
        "uint256 quoteMarket,"
        "uint256 amount,"
        "uint256 limitPrice,"
        "uint256 triggerPrice,"
        "uint256 limitFee,"
        "address makerAccountOwner,"
        "uint256 makerAccountNumber,"
        "address taker,"
        "uint256 expiration"
        ")";

    explicit OrderHasher(const DomainConfig& domain);

    const Bytes32& domain_separator() const noexcept { return domain_separator_; }

    Bytes32 struct_hash(const Order& order) const;
    OrderHash hash_order(const Order& order) const;

    static const Bytes32& domain_schema_hash();
    static const Bytes32& order_schema_hash();

private:
    Bytes32 domain_separator_{};
};

} // namespace canonical
