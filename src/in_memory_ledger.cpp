#include "ledger/in_memory_ledger.hpp"
#include "execution/canonical_orders.hpp"

namespace canonical {

Uint256 InMemoryLedger::get_market_price(const MarketId& market) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = prices_.find(market);
    return it != prices_.end() ? it->second : Uint256(0);
}

Wei InMemoryLedger::get_account_wei(const AccountInfo& account, const MarketId& market) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = balances_.find(BalanceKey{account.owner, account.number, market});
    return it != balances_.end() ? it->second : Wei{};
}

Uint256 InMemoryLedger::block_timestamp() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return timestamp_;
}

void InMemoryLedger::set_market_price(const MarketId& market, const Uint256& price) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    prices_[market] = price;
}

void InMemoryLedger::set_account_wei(const AccountInfo& account, const MarketId& market,
                                     const Wei& balance) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    balances_[BalanceKey{account.owner, account.number, market}] = balance;
}

void InMemoryLedger::set_block_timestamp(const Uint256& timestamp) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    timestamp_ = timestamp;
}

void InMemoryLedger::apply_delta(const AccountInfo& account, const MarketId& market,
                                 const Wei& delta) {
    Wei& balance = balances_[BalanceKey{account.owner, account.number, market}];
    balance = signed_add(balance, delta);
}

TradeResult InMemoryLedger::trade(CanonicalOrders& engine, const AccountInfo& taker,
                                  const AccountInfo& maker, const MarketId& input_market,
                                  const MarketId& output_market, const Wei& input_wei,
                                  std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> trade_lock(trade_mutex_);

    TradeContext ctx;
    ctx.input_market = input_market;
    ctx.output_market = output_market;
    ctx.maker_account = maker;
    ctx.taker_account = taker;
    ctx.old_input_par = get_account_wei(maker, input_market);
    ctx.new_input_par = signed_add(ctx.old_input_par, input_wei);
    ctx.input_wei = input_wei;

    TradeResult result = engine.get_trade_cost(address_, ctx, data);
    if (!result.ok()) {
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        apply_delta(maker, input_market, input_wei);
        apply_delta(maker, output_market, result.output);
        apply_delta(taker, input_market, negate(input_wei));
        apply_delta(taker, output_market, negate(result.output));
    }

    return result;
}

ControlResult InMemoryLedger::call(CanonicalOrders& engine, const AccountInfo& sender,
                                   std::span<const uint8_t> data) {
    return engine.call_function(address_, sender, data);
}

} // namespace canonical
