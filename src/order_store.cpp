#include "orders/order_store.hpp"
#include <unordered_set>

namespace canonical {

OrderStatus OrderStore::status(const OrderHash& hash) const {
    auto it = statuses_.find(hash);
    return it == statuses_.end() ? OrderStatus::Null : it->second;
}

Uint256 OrderStore::filled_amount(const OrderHash& hash) const {
    auto it = filled_.find(hash);
    return it == filled_.end() ? Uint256(0) : it->second;
}

OrderState OrderStore::state(const OrderHash& hash) const {
    return {status(hash), filled_amount(hash)};
}

size_t OrderStore::tracked_orders() const noexcept {
    std::unordered_set<OrderHash, Bytes32Hasher> keys;
    for (const auto& [hash, status] : statuses_) keys.insert(hash);
    for (const auto& [hash, amount] : filled_) keys.insert(hash);
    return keys.size();
}

// --- Transaction ---

OrderStatus OrderStore::Transaction::status(const OrderHash& hash) const {
    auto it = statuses_.find(hash);
    return it == statuses_.end() ? store_.status(hash) : it->second;
}

Uint256 OrderStore::Transaction::filled_amount(const OrderHash& hash) const {
    auto it = filled_.find(hash);
    return it == filled_.end() ? store_.filled_amount(hash) : it->second;
}

bool OrderStore::Transaction::operational() const {
    return operational_.value_or(store_.operational_);
}

void OrderStore::Transaction::set_status(const OrderHash& hash, OrderStatus status) {
    statuses_[hash] = status;
}

void OrderStore::Transaction::set_filled_amount(const OrderHash& hash, const Uint256& amount) {
    filled_[hash] = amount;
}

void OrderStore::Transaction::set_operational(bool operational) {
    operational_ = operational;
}

void OrderStore::Transaction::set_transient_trade_args(const TradeArgs& args) {
    trade_args_ = args;
}

TradeArgs OrderStore::Transaction::take_transient_trade_args() {
    TradeArgs current = trade_args_.value_or(store_.transient_trade_args_);
    trade_args_ = TradeArgs{};
    return current;
}

void OrderStore::Transaction::commit() {
    if (committed_) return;

    for (const auto& [hash, status] : statuses_) {
        store_.statuses_[hash] = status;
    }
    for (const auto& [hash, amount] : filled_) {
        store_.filled_[hash] = amount;
    }
    if (trade_args_) store_.transient_trade_args_ = *trade_args_;
    if (operational_) store_.operational_ = *operational_;

    committed_ = true;
}

} // namespace canonical
