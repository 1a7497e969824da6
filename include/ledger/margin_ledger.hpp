#pragma once

#include "common/types.hpp"

namespace canonical {

/// Read-only view of the host margin ledger the engine validates against.
/// The ledger owns balances and prices and applies the deltas the engine
/// computes; the engine never writes through this interface.
class MarginLedger {
public:
    virtual ~MarginLedger() = default;

    /// Oracle price of one unit of `market`, any common scale.
    virtual Uint256 get_market_price(const MarketId& market) const = 0;

    /// Current signed balance of `account` on `market`.
    virtual Wei get_account_wei(const AccountInfo& account, const MarketId& market) const = 0;

    /// Current time in seconds, compared against order expirations.
    virtual Uint256 block_timestamp() const = 0;
};

} // namespace canonical
