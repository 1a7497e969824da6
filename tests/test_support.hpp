#pragma once

#include "common/config.hpp"
#include "common/types.hpp"
#include "common/utils.hpp"
#include "crypto/secp256k1.hpp"
#include "crypto/typed_signature.hpp"
#include "orders/order_codec.hpp"

#include <gtest/gtest.h>
#include <optional>

namespace canonical::test_support {

constexpr uint64_t BASE_MARKET = 1;
constexpr uint64_t QUOTE_MARKET = 2;
constexpr uint64_t OTHER_MARKET = 3;

inline Uint256 units(uint64_t whole) {
    return Uint256(whole) * PRICE_BASE;
}

/// Private key whose last byte is `seed`, all other bytes zero.
inline Bytes32 test_key(uint8_t seed) {
    Bytes32 key{};
    key[31] = seed;
    return key;
}

inline Address address_of(const Bytes32& key) {
    std::optional<Address> address = address_from_private_key(key);
    EXPECT_TRUE(address.has_value());
    return address.value_or(Address{});
}

inline Address make_address(uint8_t tag) {
    Address address{};
    address[19] = tag;
    return address;
}

/// Engine config with logging off and fixed identities.
inline EngineConfig test_config() {
    EngineConfig config = default_config();
    config.enable_logging = false;
    return config;
}

/// 100-unit order at a limit price of 2000, 10 bps fee cap, never expires.
inline Order make_order(const Address& maker, bool is_buy, uint64_t salt = 1) {
    Order order;
    order.flags.salt = salt;
    order.flags.is_buy = is_buy;
    order.base_market = BASE_MARKET;
    order.quote_market = QUOTE_MARKET;
    order.amount = units(100);
    order.limit_price = units(2'000);
    order.limit_fee = PRICE_BASE / 1'000;
    order.maker_account_owner = maker;
    order.maker_account_number = 7;
    return order;
}

inline TradeArgs make_args(uint64_t price_units = 2'000, const Uint256& fee = 0,
                           bool is_negative_fee = false) {
    return TradeArgs{units(price_units), fee, is_negative_fee};
}

inline SignatureBytes sign_order(const OrderHash& hash, const Bytes32& key,
                                 SignatureType type = SignatureType::NoPrepend) {
    std::optional<TypedSignature> sig = sign_typed(hash, key, type);
    EXPECT_TRUE(sig.has_value());
    return encode_typed_signature(sig.value_or(TypedSignature{}));
}

} // namespace canonical::test_support
