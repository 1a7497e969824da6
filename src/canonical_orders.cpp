#include "execution/canonical_orders.hpp"
#include "orders/fill_pricer.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <exception>

namespace canonical {

CanonicalOrders::CanonicalOrders(const EngineConfig& config, const MarginLedger& ledger)
    : config_(config)
    , ledger_(ledger)
    , hasher_(config.domain)
    , validator_(ledger)
    , store_(config.start_operational)
{
    LOG_INFO("canonical orders engine up: domain %s v%s chain %s, domain separator %s",
             config_.domain.name.c_str(), config_.domain.version.c_str(),
             config_.domain.chain_id.str().c_str(), to_hex(hasher_.domain_separator()).c_str());
}

void CanonicalOrders::publish(std::unique_lock<std::mutex>& lock, Transaction& txn,
                              const std::vector<OrderEvent>& events) {
    txn.commit();
    events_.insert(events_.end(), events.begin(), events.end());
    EventListener listener = listener_;
    lock.unlock();

    if (listener) {
        notify(listener, events);
    }
}

void CanonicalOrders::notify(const EventListener& listener, const std::vector<OrderEvent>& events) {
    for (const OrderEvent& event : events) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            std::lock_guard<std::mutex> lock(mutex_);
            metrics_.record_listener_failure();
            LOG_ERROR("event listener threw: %s", e.what());
        }
    }
}

// --- Fill path ---

TradeResult CanonicalOrders::get_trade_cost(const Address& caller, const TradeContext& ctx,
                                            std::span<const uint8_t> data) {
    std::unique_lock<std::mutex> lock(mutex_);

    Transaction txn(store_);
    std::vector<OrderEvent> events;
    TradeResult result;
    result.error = execute_trade(txn, caller, ctx, data, events, result);

    if (!result.ok()) {
        metrics_.record_rejection(result.error);
        LOG_WARN("fill rejected: %s order %s", order_error_name(result.error),
                 to_hex(result.order_hash).c_str());
        result.output = Wei{};
        return result;
    }

    metrics_.record_fill();
    publish(lock, txn, events);
    return result;
}

OrderError CanonicalOrders::execute_trade(Transaction& txn, const Address& caller,
                                          const TradeContext& ctx, std::span<const uint8_t> data,
                                          std::vector<OrderEvent>& events, TradeResult& result) {
    if (caller != config_.ledger_address) [[unlikely]] {
        return OrderError::Unauthorized;
    }
    if (!txn.operational()) [[unlikely]] {
        return OrderError::ModuleInactive;
    }

    FillPayload payload;
    if (!decode_fill_payload(data, payload)) [[unlikely]] {
        return OrderError::DecodeError;
    }

    OrderInfo info;
    info.order = payload.order;
    info.trade_args = payload.trade_args;
    info.order_hash = hasher_.hash_order(info.order);
    result.order_hash = info.order_hash;

    // Zero inline price means "use the staged trade args", consumed exactly once.
    if (info.trade_args.price == 0) {
        info.trade_args = txn.take_transient_trade_args();
        if (info.trade_args.price == 0) [[unlikely]] {
            return OrderError::StaleTradeArgs;
        }
    }

    if (OrderError err = validator_.check_authorization(txn.status(info.order_hash), info,
                                                        payload.signature);
        err != OrderError::None) {
        return err;
    }

    if (OrderError err = validator_.check_order(info, ctx); err != OrderError::None) {
        return err;
    }

    FillQuote quote;
    if (OrderError err = quote_fill(info, ctx.input_market, ctx.input_wei, quote);
        err != OrderError::None) {
        return err;
    }

    Uint256 total_filled;
    if (OrderError err = record_fill(txn, info, quote.fill_amount, total_filled);
        err != OrderError::None) {
        return err;
    }

    if (info.order.is_decrease_only()) {
        if (OrderError err = validator_.check_decrease_only(ctx, quote.output);
            err != OrderError::None) {
            return err;
        }
    }

    OrderFilledEvent filled;
    filled.order_hash = info.order_hash;
    filled.maker = info.order.maker_account_owner;
    filled.fill_amount = quote.fill_amount;
    filled.total_filled = total_filled;
    filled.is_buy = info.order.is_buy();
    filled.trade_args = info.trade_args;
    events.emplace_back(filled);

    LOG_DEBUG("fill order %s: fill %s total %s of %s", to_hex(info.order_hash).c_str(),
              quote.fill_amount.str().c_str(), total_filled.str().c_str(),
              info.order.amount.str().c_str());

    result.output = quote.output;
    return OrderError::None;
}

// --- Delegated calls ---

ControlResult CanonicalOrders::call_function(const Address& caller, const AccountInfo& sender,
                                             std::span<const uint8_t> data) {
    std::unique_lock<std::mutex> lock(mutex_);

    Transaction txn(store_);
    std::vector<OrderEvent> events;
    ControlResult result;
    result.error = execute_call(txn, caller, sender, data, events, result);

    if (!result.ok()) {
        metrics_.record_rejection(result.error);
        LOG_WARN("delegated call rejected: %s order %s", order_error_name(result.error),
                 to_hex(result.order_hash).c_str());
        return result;
    }

    publish(lock, txn, events);
    return result;
}

OrderError CanonicalOrders::execute_call(Transaction& txn, const Address& caller,
                                         const AccountInfo& sender, std::span<const uint8_t> data,
                                         std::vector<OrderEvent>& events, ControlResult& result) {
    if (caller != config_.ledger_address) [[unlikely]] {
        return OrderError::Unauthorized;
    }

    DelegatedCall call;
    if (!decode_delegated_call(data, call)) [[unlikely]] {
        return OrderError::DecodeError;
    }

    if (const auto* approve = std::get_if<ApproveCall>(&call)) {
        result.order_hash = hasher_.hash_order(approve->order);
        OrderError err = approve_internal(txn, sender.owner, approve->order, result.order_hash, events);
        if (err == OrderError::None) metrics_.record_approval();
        return err;
    }
    if (const auto* cancel = std::get_if<CancelCall>(&call)) {
        result.order_hash = hasher_.hash_order(cancel->order);
        OrderError err = cancel_internal(txn, sender.owner, cancel->order, result.order_hash, events);
        if (err == OrderError::None) metrics_.record_cancel();
        return err;
    }

    txn.set_transient_trade_args(std::get<SetTradeArgsCall>(call).trade_args);
    metrics_.record_trade_args_staged();
    return OrderError::None;
}

// --- Direct order control ---

ControlResult CanonicalOrders::cancel_order(const Address& caller, const Order& order) {
    std::unique_lock<std::mutex> lock(mutex_);

    Transaction txn(store_);
    std::vector<OrderEvent> events;
    ControlResult result;
    result.order_hash = hasher_.hash_order(order);
    result.error = cancel_internal(txn, caller, order, result.order_hash, events);

    if (!result.ok()) {
        metrics_.record_rejection(result.error);
        LOG_WARN("cancel rejected: %s order %s", order_error_name(result.error),
                 to_hex(result.order_hash).c_str());
        return result;
    }

    metrics_.record_cancel();
    publish(lock, txn, events);
    return result;
}

ControlResult CanonicalOrders::approve_order(const Address& caller, const Order& order) {
    std::unique_lock<std::mutex> lock(mutex_);

    Transaction txn(store_);
    std::vector<OrderEvent> events;
    ControlResult result;
    result.order_hash = hasher_.hash_order(order);
    result.error = approve_internal(txn, caller, order, result.order_hash, events);

    if (!result.ok()) {
        metrics_.record_rejection(result.error);
        LOG_WARN("approve rejected: %s order %s", order_error_name(result.error),
                 to_hex(result.order_hash).c_str());
        return result;
    }

    metrics_.record_approval();
    publish(lock, txn, events);
    return result;
}

OrderError CanonicalOrders::approve_internal(Transaction& txn, const Address& approver,
                                             const Order& order, const OrderHash& hash,
                                             std::vector<OrderEvent>& events) const {
    if (approver != order.maker_account_owner) [[unlikely]] {
        return OrderError::Unauthorized;
    }
    if (!flags_encodable(order.flags)) [[unlikely]] {
        return OrderError::DecodeError;
    }
    if (txn.status(hash) == OrderStatus::Canceled) [[unlikely]] {
        return OrderError::OrderCanceled;
    }

    txn.set_status(hash, OrderStatus::Approved);
    events.emplace_back(OrderApprovedEvent{hash, approver, order.base_market, order.quote_market});
    LOG_INFO("order %s approved", to_hex(hash).c_str());
    return OrderError::None;
}

OrderError CanonicalOrders::cancel_internal(Transaction& txn, const Address& canceler,
                                            const Order& order, const OrderHash& hash,
                                            std::vector<OrderEvent>& events) const {
    if (canceler != order.maker_account_owner) [[unlikely]] {
        return OrderError::Unauthorized;
    }
    if (!flags_encodable(order.flags)) [[unlikely]] {
        return OrderError::DecodeError;
    }

    txn.set_status(hash, OrderStatus::Canceled);
    events.emplace_back(OrderCanceledEvent{hash, canceler, order.base_market, order.quote_market});
    LOG_INFO("order %s canceled", to_hex(hash).c_str());
    return OrderError::None;
}

// --- Admin ---

OrderError CanonicalOrders::shut_down(const Address& caller) {
    return set_operational(caller, false);
}

OrderError CanonicalOrders::start_up(const Address& caller) {
    return set_operational(caller, true);
}

OrderError CanonicalOrders::set_operational(const Address& caller, bool operational) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (caller != config_.owner_address) [[unlikely]] {
        metrics_.record_rejection(OrderError::Unauthorized);
        LOG_WARN("admin switch rejected: caller %s is not the owner", to_hex(caller).c_str());
        return OrderError::Unauthorized;
    }

    Transaction txn(store_);
    std::vector<OrderEvent> events;
    txn.set_operational(operational);
    events.emplace_back(ContractStatusSetEvent{operational});
    LOG_INFO("engine %s", operational ? "started up" : "shut down");
    publish(lock, txn, events);
    return OrderError::None;
}

// --- Queries ---

std::vector<OrderState> CanonicalOrders::get_order_states(std::span<const OrderHash> order_hashes) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<OrderState> states;
    states.reserve(order_hashes.size());
    for (const OrderHash& hash : order_hashes) {
        states.push_back(store_.state(hash));
    }
    return states;
}

bool CanonicalOrders::operational() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.operational();
}

TradeArgs CanonicalOrders::transient_trade_args() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return store_.transient_trade_args();
}

std::vector<OrderEvent> CanonicalOrders::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<OrderEvent> CanonicalOrders::take_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OrderEvent> taken;
    taken.swap(events_);
    return taken;
}

size_t CanonicalOrders::event_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void CanonicalOrders::set_event_listener(EventListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

EngineMetrics CanonicalOrders::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

} // namespace canonical
