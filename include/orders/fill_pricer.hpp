#pragma once

#include "common/types.hpp"
#include "orders/order_store.hpp"

namespace canonical {

/// floor(target * numerator / denominator). Fails on a zero denominator or
/// when target * numerator does not fit in 256 bits.
bool get_partial(const Uint256& target, const Uint256& numerator, const Uint256& denominator,
                 Uint256& out);

/// Fee-adjusted execution price. The fee always moves the price against the
/// maker unless it is negative, in which case it moves it in the maker's favor:
///   fee = price * trade_fee / PRICE_BASE
///   adjusted = price - fee   if is_buy == is_negative_fee
///              price + fee   otherwise
bool adjusted_price(const Order& order, const TradeArgs& args, Uint256& out);

struct FillQuote {
    Wei output;             // Opposite sign to the maker's input delta
    Uint256 fill_amount;    // Counts toward order.amount (base units)
};

/// Price one fill. `input_market` must be one of the order's markets.
///   quote is input: output = input * PRICE_BASE / adjusted, fill = output
///   base is input:  output = input * adjusted / PRICE_BASE, fill = input
OrderError quote_fill(const OrderInfo& info, const MarketId& input_market, const Wei& input_wei,
                      FillQuote& out);

/// Overfill guard: adds `fill_amount` to the order's cumulative fill inside the
/// transaction, or rejects with Overfill leaving it untouched.
OrderError record_fill(OrderStore::Transaction& txn, const OrderInfo& info,
                       const Uint256& fill_amount, Uint256& total_filled);

} // namespace canonical
