#include "common/types.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "crypto/keccak.hpp"
#include "crypto/typed_signature.hpp"
#include "execution/canonical_orders.hpp"
#include "ledger/in_memory_ledger.hpp"
#include "orders/order_codec.hpp"

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace canonical;

constexpr uint64_t BASE_MARKET = 0;     // e.g. WETH
constexpr uint64_t QUOTE_MARKET = 2;    // e.g. USDC

struct DemoMaker {
    Bytes32 private_key{};
    Address address{};
    AccountInfo account;
};

Uint256 units(uint64_t whole) {
    return Uint256(whole) * PRICE_BASE;
}

bool make_maker(uint32_t index, DemoMaker& out) {
    out.private_key = keccak256("canonical-orders-demo-maker-" + std::to_string(index));
    std::optional<Address> address = address_from_private_key(out.private_key);
    if (!address) return false;
    out.address = *address;
    out.account = AccountInfo{out.address, index};
    return true;
}

Order make_order(const DemoMaker& maker, uint32_t index, const Uint256& expiration) {
    Order order;
    order.flags.salt = index + 1;
    order.flags.is_buy = (index % 2) == 0;
    order.base_market = BASE_MARKET;
    order.quote_market = QUOTE_MARKET;
    order.amount = units(100);
    order.limit_price = order.flags.is_buy ? units(2'010) : units(1'990);
    order.limit_fee = PRICE_BASE / 1'000;   // 10 bps
    order.maker_account_owner = maker.address;
    order.maker_account_number = maker.account.number;
    order.expiration = expiration;
    return order;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace canonical;

    // --- Load config ---
    EngineConfig config;
    if (argc > 1) {
        config = load_config(argv[1]);
        printf("Loaded config from: %s\n", argv[1]);
    } else {
        config = default_config();
        printf("Using default configuration\n");
    }

    printf("\n");
    printf("=== Canonical Order Engine Simulator ===\n");
    printf("    Starting up...\n\n");

    // --- Start logger ---
    Logger::instance().set_enabled(config.enable_logging);
    Logger::instance().set_level(config.log_level);
    Logger::instance().start();
    LOG_INFO("System starting up");

    // --- Ledger and engine ---
    InMemoryLedger ledger(config.ledger_address);
    ledger.set_market_price(BASE_MARKET, units(2'000));
    ledger.set_market_price(QUOTE_MARKET, units(1));
    ledger.set_block_timestamp(Uint256(1'700'000'000));

    CanonicalOrders engine(config, ledger);
    printf("  Domain:            %s v%s (chain %s)\n", config.domain.name.c_str(),
           config.domain.version.c_str(), config.domain.chain_id.str().c_str());
    printf("  Domain separator:  %s\n", to_hex(engine.domain_separator()).c_str());
    printf("  Orders:            %u x %u fills\n\n", config.demo_orders, config.demo_fills_per_order);

    AccountInfo taker{config.owner_address, 0};
    std::vector<OrderHash> hashes;
    uint32_t fills_per_order = config.demo_fills_per_order > 0 ? config.demo_fills_per_order : 1;

    Timestamp start = now_ns();

    for (uint32_t i = 0; i < config.demo_orders; ++i) {
        DemoMaker maker;
        if (!make_maker(i, maker)) {
            LOG_ERROR("could not derive demo maker %u", i);
            continue;
        }

        Order order = make_order(maker, i, Uint256(1'800'000'000));
        OrderHash hash = engine.hash_order(order);
        hashes.push_back(hash);

        // Every third maker pre-approves instead of signing.
        bool approved = (i % 3) == 2;
        std::optional<SignatureBytes> signature;
        if (approved) {
            ControlResult approval = ledger.call(engine, maker.account,
                                                 encode_delegated_call(ApproveCall{order}));
            if (!approval.ok()) {
                printf("  order %u approval rejected: %s\n", i, order_error_name(approval.error));
                continue;
            }
        } else {
            std::optional<TypedSignature> sig = sign_typed(hash, maker.private_key,
                                                           static_cast<SignatureType>(i % 3));
            if (!sig) {
                LOG_ERROR("could not sign demo order %u", i);
                continue;
            }
            signature = encode_typed_signature(*sig);
        }

        Uint256 fill_base = order.amount / fills_per_order;
        Wei input_wei{order.is_buy(), fill_base};

        for (uint32_t f = 0; f < fills_per_order; ++f) {
            TradeArgs args{units(2'000), PRICE_BASE / 2'000, (f % 2) == 1};
            std::vector<uint8_t> data;

            // Odd fills stage their trade args through the delegated slot.
            if (f % 2 == 1) {
                ControlResult staged = ledger.call(engine, taker,
                                                   encode_delegated_call(SetTradeArgsCall{args}));
                if (!staged.ok()) {
                    printf("  order %u fill %u staging rejected: %s\n", i, f,
                           order_error_name(staged.error));
                    continue;
                }
                data = encode_fill_payload(order, TradeArgs{}, signature);
            } else {
                data = encode_fill_payload(order, args, signature);
            }

            TradeResult result = ledger.trade(engine, taker, maker.account, BASE_MARKET,
                                              QUOTE_MARKET, input_wei, data);
            if (!result.ok()) {
                printf("  order %u fill %u rejected: %s\n", i, f, order_error_name(result.error));
            }
        }

        // One more fill than the order holds.
        TradeResult over = ledger.trade(engine, taker, maker.account, BASE_MARKET, QUOTE_MARKET,
                                        input_wei,
                                        encode_fill_payload(order, TradeArgs{units(2'000), 0, false},
                                                            signature));
        if (!over.ok()) {
            printf("  order %u extra fill rejected: %s\n", i, order_error_name(over.error));
        }

        if (i + 1 == config.demo_orders) {
            ControlResult canceled = engine.cancel_order(maker.address, order);
            if (!canceled.ok()) {
                printf("  order %u cancel rejected: %s\n", i, order_error_name(canceled.error));
            }
        }
    }

    Timestamp elapsed_ns = now_ns() - start;

    // --- Report ---
    std::vector<OrderState> states = engine.get_order_states(hashes);
    printf("\n--- Order States ---\n");
    static constexpr const char* STATUS_NAMES[] = {"Null", "Approved", "Canceled"};
    for (size_t i = 0; i < states.size(); ++i) {
        printf("  %s  %-9s filled %s\n", to_hex(hashes[i]).c_str(),
               STATUS_NAMES[static_cast<size_t>(states[i].status)],
               states[i].filled_amount.str().c_str());
    }

    EngineMetrics metrics = engine.metrics();
    metrics.print_summary(static_cast<double>(elapsed_ns) / 1e9);
    printf("  Events:            %zu\n", engine.event_count());

    LOG_INFO("System shutting down");
    Logger::instance().stop();

    printf("\nDone.\n");
    return 0;
}
