#pragma once

#include "common/types.hpp"
#include "ledger/margin_ledger.hpp"
#include <map>
#include <mutex>
#include <span>
#include <tuple>

namespace canonical {

class CanonicalOrders;

/// Reference host ledger: per-market oracle prices, per-account balances and a
/// settable clock. Par and Wei are the same here (no interest index).
///
/// trade() plays the trusted caller of the engine's fill entry point: it
/// proposes the maker's input delta, asks the engine for the output delta and
/// settles both legs between maker and taker only if the engine accepts.
class InMemoryLedger : public MarginLedger {
public:
    explicit InMemoryLedger(const Address& address) noexcept : address_(address) {}

    // MarginLedger
    Uint256 get_market_price(const MarketId& market) const override;
    Wei get_account_wei(const AccountInfo& account, const MarketId& market) const override;
    Uint256 block_timestamp() const override;

    void set_market_price(const MarketId& market, const Uint256& price);
    void set_account_wei(const AccountInfo& account, const MarketId& market, const Wei& balance);
    void set_block_timestamp(const Uint256& timestamp);

    const Address& address() const noexcept { return address_; }

    /// Trade `input_wei` of `input_market` into the maker's account against
    /// the order in `data`. Balances are untouched on rejection.
    TradeResult trade(CanonicalOrders& engine, const AccountInfo& taker, const AccountInfo& maker,
                      const MarketId& input_market, const MarketId& output_market,
                      const Wei& input_wei, std::span<const uint8_t> data);

    /// Forward a delegated call issued by `sender`.
    ControlResult call(CanonicalOrders& engine, const AccountInfo& sender,
                       std::span<const uint8_t> data);

private:
    struct BalanceKey {
        Address owner;
        Uint256 number;
        MarketId market;

        bool operator<(const BalanceKey& other) const {
            return std::tie(owner, number, market) < std::tie(other.owner, other.number, other.market);
        }
    };

    void apply_delta(const AccountInfo& account, const MarketId& market, const Wei& delta);

    const Address address_;

    // Serializes whole trades so the balances read before the engine call are
    // still current when the result is settled.
    std::mutex trade_mutex_;

    mutable std::mutex state_mutex_;
    std::map<MarketId, Uint256> prices_;
    std::map<BalanceKey, Wei> balances_;
    Uint256 timestamp_ = 0;
};

} // namespace canonical
