#include "orders/trade_validator.hpp"
#include "orders/fill_pricer.hpp"

namespace canonical {

OrderError TradeValidator::check_authorization(OrderStatus status, const OrderInfo& info,
                                               const std::optional<SignatureBytes>& signature) const {
    if (status == OrderStatus::Canceled) [[unlikely]] {
        return OrderError::OrderCanceled;
    }
    if (status == OrderStatus::Approved) {
        return OrderError::None;
    }

    if (!signature) [[unlikely]] {
        return OrderError::InvalidSignature;
    }
    std::optional<Address> signer = recover_signer(info.order_hash, *signature);
    if (!signer || *signer != info.order.maker_account_owner) [[unlikely]] {
        return OrderError::InvalidSignature;
    }
    return OrderError::None;
}

OrderError TradeValidator::check_price(const Order& order, const TradeArgs& args) const noexcept {
    bool valid = order.is_buy()
        ? args.price <= order.limit_price
        : args.price >= order.limit_price;
    return valid ? OrderError::None : OrderError::PriceOutOfBounds;
}

OrderError TradeValidator::check_fee(const Order& order, const TradeArgs& args) const noexcept {
    // A negative fee always satisfies an order that tolerates a positive one.
    bool valid = order.is_negative_fee()
        ? (args.is_negative_fee && args.fee >= order.limit_fee)
        : (args.is_negative_fee || args.fee <= order.limit_fee);
    return valid ? OrderError::None : OrderError::FeeOutOfBounds;
}

bool TradeValidator::current_price(const MarketId& base_market, const MarketId& quote_market,
                                   Uint256& out) const {
    Uint256 base_price = ledger_.get_market_price(base_market);
    Uint256 quote_price = ledger_.get_market_price(quote_market);
    return get_partial(base_price, PRICE_BASE, quote_price, out);
}

OrderError TradeValidator::check_trigger(const Order& order) const {
    if (order.trigger_price == 0) {
        return OrderError::None;
    }

    Uint256 current;
    if (!current_price(order.base_market, order.quote_market, current)) [[unlikely]] {
        return OrderError::ArithmeticError;
    }
    bool triggered = order.is_buy()
        ? current >= order.trigger_price
        : current <= order.trigger_price;
    return triggered ? OrderError::None : OrderError::NotTriggered;
}

OrderError TradeValidator::check_order(const OrderInfo& info, const TradeContext& ctx) const {
    const Order& order = info.order;

    // 1. Price and fee limits
    if (OrderError err = check_price(order, info.trade_args); err != OrderError::None) [[unlikely]] {
        return err;
    }
    if (OrderError err = check_fee(order, info.trade_args); err != OrderError::None) [[unlikely]] {
        return err;
    }

    // 2. Trigger price (reads the ledger's oracle prices)
    if (OrderError err = check_trigger(order); err != OrderError::None) [[unlikely]] {
        return err;
    }

    // 3. Expiry
    if (order.expiration != 0 && order.expiration < ledger_.block_timestamp()) [[unlikely]] {
        return OrderError::Expired;
    }

    // 4. Maker account must be exactly the order's account
    if (ctx.maker_account.owner != order.maker_account_owner ||
        ctx.maker_account.number != order.maker_account_number) [[unlikely]] {
        return OrderError::AccountMismatch;
    }

    // 5. Optional counterparty restriction
    if (!is_zero_address(order.taker) && order.taker != ctx.taker_account.owner) [[unlikely]] {
        return OrderError::TakerMismatch;
    }

    // 6. Markets in either orientation
    bool markets_match =
        (order.base_market == ctx.output_market && order.quote_market == ctx.input_market) ||
        (order.quote_market == ctx.output_market && order.base_market == ctx.input_market);
    if (!markets_match) [[unlikely]] {
        return OrderError::MarketMismatch;
    }

    // 7. Direction: a buy receives base / pays quote, a sell the reverse
    if (ctx.input_wei.is_zero()) [[unlikely]] {
        return OrderError::ZeroInput;
    }
    bool expected_sign = (order.base_market == ctx.input_market) == order.is_buy();
    if (ctx.input_wei.sign != expected_sign) [[unlikely]] {
        return OrderError::DirectionMismatch;
    }

    return OrderError::None;
}

OrderError TradeValidator::check_decrease_only(const TradeContext& ctx, const Wei& output) const {
    // Input market: the balance may shrink toward zero but not grow or flip.
    const Par& old_par = ctx.old_input_par;
    const Par& new_par = ctx.new_input_par;
    bool input_ok = new_par.is_zero() ||
        (new_par.value <= old_par.value && new_par.sign == old_par.sign);
    if (!input_ok) [[unlikely]] {
        return OrderError::DecreaseViolation;
    }

    // Output market: compared against the balance as it stands before this fill.
    Wei old_output = ledger_.get_account_wei(ctx.maker_account, ctx.output_market);
    bool output_ok = output.value == 0 ||
        (output.value <= old_output.value && output.sign != old_output.sign);
    if (!output_ok) [[unlikely]] {
        return OrderError::DecreaseViolation;
    }

    return OrderError::None;
}

} // namespace canonical
