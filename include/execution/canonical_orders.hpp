#pragma once

#include "common/types.hpp"
#include "common/config.hpp"
#include "ledger/margin_ledger.hpp"
#include "monitoring/engine_metrics.hpp"
#include "orders/order_codec.hpp"
#include "orders/order_events.hpp"
#include "orders/order_hasher.hpp"
#include "orders/order_store.hpp"
#include "orders/trade_validator.hpp"
#include <mutex>
#include <span>
#include <vector>

namespace canonical {

/// Canonical order engine: validates signed off-chain orders against trades
/// proposed by the margin ledger and accounts for how much of each order has
/// been filled.
///
/// Every public operation is one transaction. It runs under an exclusive lock,
/// stages its writes in an OrderStore::Transaction and publishes state and
/// events only if it succeeds; a rejected call leaves no trace beyond metrics
/// and a log line.
class CanonicalOrders {
public:
    CanonicalOrders(const EngineConfig& config, const MarginLedger& ledger);

    CanonicalOrders(const CanonicalOrders&) = delete;
    CanonicalOrders& operator=(const CanonicalOrders&) = delete;

    /// Fill entry point, callable only by the ledger. Returns the delta to
    /// apply to the maker's output-market balance.
    TradeResult get_trade_cost(const Address& caller, const TradeContext& ctx,
                               std::span<const uint8_t> data);

    /// Delegated entry point, callable only by the ledger on behalf of
    /// `sender`: approve, cancel, or stage trade args.
    ControlResult call_function(const Address& caller, const AccountInfo& sender,
                                std::span<const uint8_t> data);

    /// Direct order control; `caller` must be the order's maker. An order whose
    /// salt does not fit the flags word is rejected with DecodeError.
    ControlResult cancel_order(const Address& caller, const Order& order);
    ControlResult approve_order(const Address& caller, const Order& order);

    /// Admin switch; `caller` must be the owner.
    OrderError shut_down(const Address& caller);
    OrderError start_up(const Address& caller);

    // Queries
    std::vector<OrderState> get_order_states(std::span<const OrderHash> order_hashes) const;
    bool operational() const;
    TradeArgs transient_trade_args() const;
    OrderHash hash_order(const Order& order) const { return hasher_.hash_order(order); }
    const Bytes32& domain_separator() const noexcept { return hasher_.domain_separator(); }

    std::vector<OrderEvent> events() const;
    size_t event_count() const;

    /// Hand over every retained event and clear the log. Long-running hosts
    /// call this periodically; the log is otherwise unbounded.
    std::vector<OrderEvent> take_events();

    /// Invoked with each event of a call after it commits and after the
    /// engine lock is released, on the calling thread. The listener may query
    /// the engine. A std::exception it throws is logged and counted; the call
    /// still reports success. Calls racing on other threads may notify out of
    /// order with respect to events().
    void set_event_listener(EventListener listener);

    EngineMetrics metrics() const;

private:
    using Transaction = OrderStore::Transaction;

    OrderError execute_trade(Transaction& txn, const Address& caller, const TradeContext& ctx,
                             std::span<const uint8_t> data, std::vector<OrderEvent>& events,
                             TradeResult& result);
    OrderError execute_call(Transaction& txn, const Address& caller, const AccountInfo& sender,
                            std::span<const uint8_t> data, std::vector<OrderEvent>& events,
                            ControlResult& result);

    OrderError approve_internal(Transaction& txn, const Address& approver, const Order& order,
                                const OrderHash& hash, std::vector<OrderEvent>& events) const;
    OrderError cancel_internal(Transaction& txn, const Address& canceler, const Order& order,
                               const OrderHash& hash, std::vector<OrderEvent>& events) const;
    OrderError set_operational(const Address& caller, bool operational);

    /// Commit, append to the log, release `lock`, then notify the listener.
    void publish(std::unique_lock<std::mutex>& lock, Transaction& txn,
                 const std::vector<OrderEvent>& events);
    void notify(const EventListener& listener, const std::vector<OrderEvent>& events);

    const EngineConfig config_;
    const MarginLedger& ledger_;
    const OrderHasher hasher_;
    const TradeValidator validator_;

    mutable std::mutex mutex_;
    OrderStore store_;
    std::vector<OrderEvent> events_;
    EventListener listener_;
    EngineMetrics metrics_;
};

} // namespace canonical
