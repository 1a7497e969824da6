#pragma once

#include "common/types.hpp"
#include "crypto/typed_signature.hpp"
#include "ledger/margin_ledger.hpp"
#include <optional>

namespace canonical {

/// Everything the ledger asserts about one proposed trade against the maker.
struct TradeContext {
    MarketId input_market = 0;
    MarketId output_market = 0;
    AccountInfo maker_account;
    AccountInfo taker_account;
    Par old_input_par;      // Maker's input-market balance before the trade
    Par new_input_par;      // ... and after it
    Wei input_wei;          // Maker's input-market delta
};

/// Business rules for filling a canonical order. Stateless apart from the
/// ledger it reads prices, balances and time from.
/// Checks run in a fixed order and stop at the first failure.
class TradeValidator {
public:
    explicit TradeValidator(const MarginLedger& ledger) noexcept : ledger_(ledger) {}

    /// Identity & authorization. Null orders need a signature by the maker,
    /// canceled orders are rejected, approved orders skip the signature.
    OrderError check_authorization(OrderStatus status, const OrderInfo& info,
                                   const std::optional<SignatureBytes>& signature) const;

    /// Price/fee bounds, trigger, expiry, accounts, markets and direction.
    OrderError check_order(const OrderInfo& info, const TradeContext& ctx) const;

    OrderError check_price(const Order& order, const TradeArgs& args) const noexcept;
    OrderError check_fee(const Order& order, const TradeArgs& args) const noexcept;
    OrderError check_trigger(const Order& order) const;

    /// Decrease-only guard. `output` is the maker's computed output-market delta.
    /// The output-market balance is read from the ledger before the fill applies.
    OrderError check_decrease_only(const TradeContext& ctx, const Wei& output) const;

    /// base price * PRICE_BASE / quote price. False when the quote price is zero
    /// or the product overflows.
    bool current_price(const MarketId& base_market, const MarketId& quote_market, Uint256& out) const;

private:
    const MarginLedger& ledger_;
};

} // namespace canonical
