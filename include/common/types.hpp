#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace canonical {

// Core type aliases
using Uint256 = boost::multiprecision::uint256_t;
using Uint512 = boost::multiprecision::uint512_t;
using MarketId = Uint256;
using Address = std::array<uint8_t, 20>;
using Bytes32 = std::array<uint8_t, 32>;
using OrderHash = Bytes32;

// Constants
constexpr uint64_t PRICE_BASE_U64 = 1'000'000'000'000'000'000ULL;  // 10^18
inline const Uint256 PRICE_BASE{PRICE_BASE_U64};

constexpr size_t WORD_BYTES = 32;
constexpr size_t ORDER_WORDS = 11;
constexpr size_t TRADE_ARGS_WORDS = 3;
constexpr size_t ORDER_STRUCT_BYTES = ORDER_WORDS * WORD_BYTES;              // 352
constexpr size_t ORDER_BYTES = (ORDER_WORDS + TRADE_ARGS_WORDS) * WORD_BYTES;  // 448
constexpr size_t SIGNATURE_BYTES = 66;

// Enums
enum class OrderStatus : uint8_t {
    Null = 0,
    Approved = 1,
    Canceled = 2
};

enum class OrderError : uint8_t {
    None = 0,
    ModuleInactive,
    DecodeError,
    InvalidSignature,
    OrderCanceled,
    StaleTradeArgs,
    PriceOutOfBounds,
    FeeOutOfBounds,
    NotTriggered,
    Expired,
    AccountMismatch,
    TakerMismatch,
    MarketMismatch,
    DirectionMismatch,
    ZeroInput,
    Overfill,
    DecreaseViolation,
    Unauthorized,
    ArithmeticError
};

constexpr size_t ORDER_ERROR_COUNT = static_cast<size_t>(OrderError::ArithmeticError) + 1;

constexpr const char* order_error_name(OrderError error) noexcept {
    switch (error) {
        case OrderError::None:              return "None";
        case OrderError::ModuleInactive:    return "ModuleInactive";
        case OrderError::DecodeError:       return "DecodeError";
        case OrderError::InvalidSignature:  return "InvalidSignature";
        case OrderError::OrderCanceled:     return "OrderCanceled";
        case OrderError::StaleTradeArgs:    return "StaleTradeArgs";
        case OrderError::PriceOutOfBounds:  return "PriceOutOfBounds";
        case OrderError::FeeOutOfBounds:    return "FeeOutOfBounds";
        case OrderError::NotTriggered:      return "NotTriggered";
        case OrderError::Expired:           return "Expired";
        case OrderError::AccountMismatch:   return "AccountMismatch";
        case OrderError::TakerMismatch:     return "TakerMismatch";
        case OrderError::MarketMismatch:    return "MarketMismatch";
        case OrderError::DirectionMismatch: return "DirectionMismatch";
        case OrderError::ZeroInput:         return "ZeroInput";
        case OrderError::Overfill:          return "Overfill";
        case OrderError::DecreaseViolation: return "DecreaseViolation";
        case OrderError::Unauthorized:      return "Unauthorized";
        case OrderError::ArithmeticError:   return "ArithmeticError";
    }
    return "Unknown";
}

// Signed balance or delta. sign == true means positive.
struct SignedAmount {
    bool sign = false;
    Uint256 value = 0;

    bool is_zero() const { return value == 0; }
    bool is_positive() const { return sign && value != 0; }
    bool is_negative() const { return !sign && value != 0; }

    bool operator==(const SignedAmount&) const = default;
};

using Wei = SignedAmount;
using Par = SignedAmount;

inline SignedAmount negate(const SignedAmount& a) {
    return {!a.sign, a.value};
}

inline SignedAmount signed_add(const SignedAmount& a, const SignedAmount& b) {
    if (a.sign == b.sign) {
        return {a.sign, a.value + b.value};
    }
    if (a.value >= b.value) {
        return {a.sign, a.value - b.value};
    }
    return {b.sign, b.value - a.value};
}

struct AccountInfo {
    Address owner{};
    Uint256 number = 0;

    bool operator==(const AccountInfo&) const = default;
};

// Flags word split once at ingestion: bit 0 isBuy, bit 1 isDecreaseOnly,
// bit 2 isNegativeFee, bits 3..255 salt.
struct OrderFlags {
    Uint256 salt = 0;
    bool is_buy = false;
    bool is_decrease_only = false;
    bool is_negative_fee = false;

    bool operator==(const OrderFlags&) const = default;
};

struct Order {
    OrderFlags flags;
    MarketId base_market = 0;
    MarketId quote_market = 0;
    Uint256 amount = 0;
    Uint256 limit_price = 0;
    Uint256 trigger_price = 0;
    Uint256 limit_fee = 0;
    Address maker_account_owner{};
    Uint256 maker_account_number = 0;
    Address taker{};
    Uint256 expiration = 0;

    bool is_buy() const noexcept { return flags.is_buy; }
    bool is_decrease_only() const noexcept { return flags.is_decrease_only; }
    bool is_negative_fee() const noexcept { return flags.is_negative_fee; }

    bool operator==(const Order&) const = default;
};

struct TradeArgs {
    Uint256 price = 0;
    Uint256 fee = 0;
    bool is_negative_fee = false;

    bool operator==(const TradeArgs&) const = default;
};

// Derived per fill attempt, never persisted.
struct OrderInfo {
    Order order;
    TradeArgs trade_args;
    OrderHash order_hash{};
};

struct OrderState {
    OrderStatus status = OrderStatus::Null;
    Uint256 filled_amount = 0;
};

struct TradeResult {
    OrderError error = OrderError::None;
    OrderHash order_hash{};
    Wei output;    // Delta to apply to the maker's output market balance

    bool ok() const noexcept { return error == OrderError::None; }
};

struct ControlResult {
    OrderError error = OrderError::None;
    OrderHash order_hash{};

    bool ok() const noexcept { return error == OrderError::None; }
};

inline bool is_zero_address(const Address& address) noexcept {
    for (uint8_t b : address) {
        if (b != 0) return false;
    }
    return true;
}

// Bytes32 keys are already uniformly distributed hash output.
struct Bytes32Hasher {
    size_t operator()(const Bytes32& key) const noexcept {
        size_t h;
        std::memcpy(&h, key.data(), sizeof(h));
        return h;
    }
};

} // namespace canonical
