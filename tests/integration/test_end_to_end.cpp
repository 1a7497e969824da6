#include <gtest/gtest.h>
#include "common/types.hpp"
#include "common/config.hpp"
#include "execution/canonical_orders.hpp"
#include "ledger/in_memory_ledger.hpp"
#include "orders/order_codec.hpp"
#include "test_support.hpp"

#include <vector>

using namespace canonical;
using namespace canonical::test_support;

TEST(EndToEndTest, FullOrderLifecycle) {
    EngineConfig config = test_config();
    InMemoryLedger ledger(config.ledger_address);
    ledger.set_market_price(BASE_MARKET, units(2'000));
    ledger.set_market_price(QUOTE_MARKET, units(1));
    ledger.set_block_timestamp(1'700'000'000);

    CanonicalOrders engine(config, ledger);

    Bytes32 maker_key = test_key(101);
    AccountInfo maker{address_of(maker_key), 1};
    AccountInfo taker{make_address(0xee), 0};

    // Maker buys 100 base at up to 2000, 10 bps fee cap, expiring in the future
    Order order = make_order(maker.owner, true, 555);
    order.maker_account_number = maker.number;
    order.expiration = 1'800'000'000;
    OrderHash hash = engine.hash_order(order);
    SignatureBytes sig = sign_order(hash, maker_key, SignatureType::Decimal);

    // 1. Signed fill paying quote: 50000 quote at 2000 buys 25 base
    TradeResult first = ledger.trade(engine, taker, maker, QUOTE_MARKET, BASE_MARKET,
                                     Wei{false, units(50'000)},
                                     encode_fill_payload(order, make_args(2'000), sig));
    ASSERT_TRUE(first.ok()) << order_error_name(first.error);
    EXPECT_EQ(first.output, (Wei{true, units(25)}));

    // 2. Maker approves so later fills can drop the signature
    ASSERT_TRUE(ledger.call(engine, maker, encode_delegated_call(ApproveCall{order})).ok());

    // 3. Staged trade args with a negative fee: base input, 25 base at 2000 less 5 bps
    TradeArgs staged{units(2'000), PRICE_BASE / 2'000, true};
    ASSERT_TRUE(ledger.call(engine, taker, encode_delegated_call(SetTradeArgsCall{staged})).ok());
    TradeResult second = ledger.trade(engine, taker, maker, BASE_MARKET, QUOTE_MARKET,
                                      Wei{true, units(25)},
                                      encode_fill_payload(order, TradeArgs{}));
    ASSERT_TRUE(second.ok()) << order_error_name(second.error);
    EXPECT_EQ(second.output, (Wei{false, units(49'975)}));

    // 4. Too large: 51 base on top of 50 filled
    TradeResult over = ledger.trade(engine, taker, maker, BASE_MARKET, QUOTE_MARKET,
                                    Wei{true, units(51)},
                                    encode_fill_payload(order, make_args(2'000)));
    EXPECT_EQ(over.error, OrderError::Overfill);

    // 5. Cancel; nothing fills afterwards
    ASSERT_TRUE(engine.cancel_order(maker.owner, order).ok());
    TradeResult after_cancel = ledger.trade(engine, taker, maker, BASE_MARKET, QUOTE_MARKET,
                                            Wei{true, units(1)},
                                            encode_fill_payload(order, make_args(2'000), sig));
    EXPECT_EQ(after_cancel.error, OrderError::OrderCanceled);

    // Final state
    std::vector<OrderState> states = engine.get_order_states(std::vector<OrderHash>{hash});
    EXPECT_EQ(states[0].status, OrderStatus::Canceled);
    EXPECT_EQ(states[0].filled_amount, units(50));

    EXPECT_EQ(ledger.get_account_wei(maker, BASE_MARKET), (Wei{true, units(50)}));
    EXPECT_EQ(ledger.get_account_wei(maker, QUOTE_MARKET), (Wei{false, units(99'975)}));
    EXPECT_EQ(ledger.get_account_wei(taker, BASE_MARKET), (Wei{false, units(50)}));
    EXPECT_EQ(ledger.get_account_wei(taker, QUOTE_MARKET), (Wei{true, units(99'975)}));

    // Filled, Approved, Filled, Canceled
    std::vector<OrderEvent> events = engine.events();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<OrderFilledEvent>(events[0]));
    EXPECT_TRUE(std::holds_alternative<OrderApprovedEvent>(events[1]));
    EXPECT_TRUE(std::holds_alternative<OrderFilledEvent>(events[2]));
    EXPECT_TRUE(std::holds_alternative<OrderCanceledEvent>(events[3]));
    EXPECT_EQ(std::get<OrderFilledEvent>(events[2]).total_filled, units(50));
    EXPECT_TRUE(std::get<OrderFilledEvent>(events[2]).trade_args.is_negative_fee);

    EngineMetrics metrics = engine.metrics();
    EXPECT_EQ(metrics.fills(), 2u);
    EXPECT_EQ(metrics.approvals(), 1u);
    EXPECT_EQ(metrics.cancels(), 1u);
    EXPECT_EQ(metrics.trade_args_staged(), 1u);
    EXPECT_EQ(metrics.rejections(OrderError::Overfill), 1u);
    EXPECT_EQ(metrics.rejections(OrderError::OrderCanceled), 1u);
}

TEST(EndToEndTest, TriggeredSellAfterPriceDrop) {
    EngineConfig config = test_config();
    InMemoryLedger ledger(config.ledger_address);
    ledger.set_market_price(BASE_MARKET, units(2'000));
    ledger.set_market_price(QUOTE_MARKET, units(1));

    CanonicalOrders engine(config, ledger);
    Bytes32 maker_key = test_key(102);
    AccountInfo maker{address_of(maker_key), 7};
    AccountInfo taker{make_address(0xef), 0};

    // Stop-loss: sell once base trades at or below 1900
    Order stop = make_order(maker.owner, false, 9);
    stop.limit_price = units(1'850);
    stop.trigger_price = units(1'900);
    std::vector<uint8_t> data = encode_fill_payload(stop, make_args(1'880),
                                                    sign_order(engine.hash_order(stop), maker_key));

    TradeResult early = ledger.trade(engine, taker, maker, BASE_MARKET, QUOTE_MARKET,
                                     Wei{false, units(1)}, data);
    EXPECT_EQ(early.error, OrderError::NotTriggered);

    ledger.set_market_price(BASE_MARKET, units(1'890));
    TradeResult triggered = ledger.trade(engine, taker, maker, BASE_MARKET, QUOTE_MARKET,
                                         Wei{false, units(1)}, data);
    ASSERT_TRUE(triggered.ok()) << order_error_name(triggered.error);
    EXPECT_EQ(triggered.output, (Wei{true, units(1'880)}));
}

TEST(EndToEndTest, RestrictedTakerAndDomainIsolation) {
    EngineConfig config = test_config();
    InMemoryLedger ledger(config.ledger_address);
    ledger.set_market_price(BASE_MARKET, units(2'000));
    ledger.set_market_price(QUOTE_MARKET, units(1));

    CanonicalOrders engine(config, ledger);

    EngineConfig other_config = test_config();
    other_config.domain.chain_id = 5;
    CanonicalOrders other_engine(other_config, ledger);

    Bytes32 maker_key = test_key(103);
    AccountInfo maker{address_of(maker_key), 7};
    AccountInfo allowed{make_address(0x01), 0};
    AccountInfo stranger{make_address(0x02), 0};

    Order order = make_order(maker.owner, true, 77);
    order.taker = allowed.owner;

    // A signature for one domain does not authorize the order elsewhere
    SignatureBytes sig = sign_order(engine.hash_order(order), maker_key);
    std::vector<uint8_t> data = encode_fill_payload(order, make_args(), sig);
    EXPECT_EQ(ledger.trade(other_engine, allowed, maker, BASE_MARKET, QUOTE_MARKET,
                           Wei{true, units(1)}, data).error,
              OrderError::InvalidSignature);

    EXPECT_EQ(ledger.trade(engine, stranger, maker, BASE_MARKET, QUOTE_MARKET,
                           Wei{true, units(1)}, data).error,
              OrderError::TakerMismatch);
    EXPECT_TRUE(ledger.trade(engine, allowed, maker, BASE_MARKET, QUOTE_MARKET,
                             Wei{true, units(1)}, data).ok());
}
