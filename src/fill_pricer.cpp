#include "orders/fill_pricer.hpp"

namespace canonical {

namespace {

bool fits_256(const Uint512& value) {
    return (value >> 256) == 0;
}

} // anonymous namespace

bool get_partial(const Uint256& target, const Uint256& numerator, const Uint256& denominator,
                 Uint256& out) {
    if (denominator == 0) return false;
    Uint512 product = static_cast<Uint512>(target) * static_cast<Uint512>(numerator);
    if (!fits_256(product)) return false;
    out = static_cast<Uint256>(product / static_cast<Uint512>(denominator));
    return true;
}

bool adjusted_price(const Order& order, const TradeArgs& args, Uint256& out) {
    Uint256 fee;
    if (!get_partial(args.price, args.fee, PRICE_BASE, fee)) return false;

    if (order.is_buy() == args.is_negative_fee) {
        if (fee > args.price) return false;
        out = args.price - fee;
        return true;
    }

    Uint512 sum = static_cast<Uint512>(args.price) + static_cast<Uint512>(fee);
    if (!fits_256(sum)) return false;
    out = static_cast<Uint256>(sum);
    return true;
}

OrderError quote_fill(const OrderInfo& info, const MarketId& input_market, const Wei& input_wei,
                      FillQuote& out) {
    Uint256 price;
    if (!adjusted_price(info.order, info.trade_args, price)) {
        return OrderError::ArithmeticError;
    }

    FillQuote quote;
    quote.output.sign = !input_wei.sign;

    if (info.order.quote_market == input_market) {
        if (!get_partial(input_wei.value, PRICE_BASE, price, quote.output.value)) {
            return OrderError::ArithmeticError;
        }
        quote.fill_amount = quote.output.value;
    } else {
        if (!get_partial(input_wei.value, price, PRICE_BASE, quote.output.value)) {
            return OrderError::ArithmeticError;
        }
        quote.fill_amount = input_wei.value;
    }

    out = quote;
    return OrderError::None;
}

OrderError record_fill(OrderStore::Transaction& txn, const OrderInfo& info,
                       const Uint256& fill_amount, Uint256& total_filled) {
    Uint256 previous = txn.filled_amount(info.order_hash);
    Uint512 total = static_cast<Uint512>(previous) + static_cast<Uint512>(fill_amount);
    if (total > static_cast<Uint512>(info.order.amount)) {
        return OrderError::Overfill;
    }

    total_filled = static_cast<Uint256>(total);
    txn.set_filled_amount(info.order_hash, total_filled);
    return OrderError::None;
}

} // namespace canonical
