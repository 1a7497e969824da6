#pragma once

#include "common/types.hpp"
#include <optional>
#include <unordered_map>

namespace canonical {

/// Mutable engine state: per-order status and cumulative fill, the transient
/// trade-args staging slot, and the operational flag.
///
/// Entries are created implicitly (Null / 0) on first reference. All writes go
/// through a Transaction, which buffers them and publishes on commit(); a
/// Transaction destroyed without commit() leaves the store untouched.
class OrderStore {
public:
    class Transaction {
    public:
        explicit Transaction(OrderStore& store) noexcept : store_(store) {}

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        OrderStatus status(const OrderHash& hash) const;
        Uint256 filled_amount(const OrderHash& hash) const;
        bool operational() const;

        void set_status(const OrderHash& hash, OrderStatus status);
        void set_filled_amount(const OrderHash& hash, const Uint256& amount);
        void set_operational(bool operational);
        void set_transient_trade_args(const TradeArgs& args);

        /// Read the staging slot and clear it in the same step.
        TradeArgs take_transient_trade_args();

        void commit();
        bool committed() const noexcept { return committed_; }

    private:
        OrderStore& store_;
        std::unordered_map<OrderHash, OrderStatus, Bytes32Hasher> statuses_;
        std::unordered_map<OrderHash, Uint256, Bytes32Hasher> filled_;
        std::optional<TradeArgs> trade_args_;
        std::optional<bool> operational_;
        bool committed_ = false;
    };

    explicit OrderStore(bool operational = true) noexcept : operational_(operational) {}

    OrderStatus status(const OrderHash& hash) const;
    Uint256 filled_amount(const OrderHash& hash) const;
    OrderState state(const OrderHash& hash) const;

    const TradeArgs& transient_trade_args() const noexcept { return transient_trade_args_; }
    bool operational() const noexcept { return operational_; }

    size_t tracked_orders() const noexcept;

private:
    std::unordered_map<OrderHash, OrderStatus, Bytes32Hasher> statuses_;
    std::unordered_map<OrderHash, Uint256, Bytes32Hasher> filled_;
    TradeArgs transient_trade_args_;
    bool operational_;
};

} // namespace canonical
