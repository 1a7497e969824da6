#pragma once

#include "common/types.hpp"
#include <functional>
#include <variant>

namespace canonical {

struct ContractStatusSetEvent {
    bool operational = false;
};

struct OrderCanceledEvent {
    OrderHash order_hash{};
    Address canceler{};
    MarketId base_market = 0;
    MarketId quote_market = 0;
};

struct OrderApprovedEvent {
    OrderHash order_hash{};
    Address approver{};
    MarketId base_market = 0;
    MarketId quote_market = 0;
};

struct OrderFilledEvent {
    OrderHash order_hash{};
    Address maker{};
    Uint256 fill_amount = 0;
    Uint256 total_filled = 0;
    bool is_buy = false;
    TradeArgs trade_args;
};

using OrderEvent = std::variant<ContractStatusSetEvent, OrderCanceledEvent,
                                OrderApprovedEvent, OrderFilledEvent>;

using EventListener = std::function<void(const OrderEvent&)>;

} // namespace canonical
