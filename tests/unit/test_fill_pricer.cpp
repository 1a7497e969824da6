#include <gtest/gtest.h>
#include "orders/fill_pricer.hpp"
#include "crypto/keccak.hpp"
#include "test_support.hpp"

using namespace canonical;
using namespace canonical::test_support;

namespace {

OrderInfo make_info(bool is_buy, const TradeArgs& args, const Uint256& amount = 100) {
    OrderInfo info;
    info.order = make_order(make_address(1), is_buy);
    info.order.amount = amount;
    info.order.limit_price = units(2);
    info.trade_args = args;
    info.order_hash = keccak256("fill pricer order");
    return info;
}

Uint256 max_uint256() {
    return ~Uint256(0);
}

} // anonymous namespace

// --- get_partial ---

TEST(FillPricerTest, GetPartialFloors) {
    Uint256 out;
    ASSERT_TRUE(get_partial(10, 1, 3, out));
    EXPECT_EQ(out, 3);
    ASSERT_TRUE(get_partial(7, 2, 7, out));
    EXPECT_EQ(out, 2);
}

TEST(FillPricerTest, GetPartialZeroDenominator) {
    Uint256 out = 42;
    EXPECT_FALSE(get_partial(10, 1, 0, out));
    EXPECT_EQ(out, 42);
}

TEST(FillPricerTest, GetPartialProductOverflow) {
    Uint256 out;
    EXPECT_FALSE(get_partial(max_uint256(), 2, 2, out));
    ASSERT_TRUE(get_partial(max_uint256(), 1, 1, out));
    EXPECT_EQ(out, max_uint256());
}

// --- adjusted_price ---

TEST(FillPricerTest, AdjustedPriceFeeDirections) {
    Order buy = make_order(make_address(1), true);
    Order sell = make_order(make_address(1), false);
    Uint256 fee = PRICE_BASE / 100;   // 1%
    Uint256 out;

    // Positive fee costs the maker: buyer pays more, seller receives less
    ASSERT_TRUE(adjusted_price(buy, TradeArgs{units(100), fee, false}, out));
    EXPECT_EQ(out, units(101));
    ASSERT_TRUE(adjusted_price(sell, TradeArgs{units(100), fee, false}, out));
    EXPECT_EQ(out, units(99));

    // Negative fee favors the maker
    ASSERT_TRUE(adjusted_price(buy, TradeArgs{units(100), fee, true}, out));
    EXPECT_EQ(out, units(99));
    ASSERT_TRUE(adjusted_price(sell, TradeArgs{units(100), fee, true}, out));
    EXPECT_EQ(out, units(101));
}

TEST(FillPricerTest, AdjustedPriceUnderflow) {
    Order sell = make_order(make_address(1), false);
    Uint256 out;
    // Fee rate above 100% on the subtracting branch
    EXPECT_FALSE(adjusted_price(sell, TradeArgs{units(1), PRICE_BASE * 2, false}, out));
}

TEST(FillPricerTest, AdjustedPriceAdditionOverflow) {
    Order buy = make_order(make_address(1), true);
    Uint256 out;
    EXPECT_FALSE(adjusted_price(buy, TradeArgs{max_uint256(), 1, false}, out));
    EXPECT_FALSE(adjusted_price(buy, TradeArgs{max_uint256(), PRICE_BASE, false}, out));
}

// --- quote_fill ---

TEST(FillPricerTest, QuoteInputScenario) {
    // Buy 100 base at 2.0; the maker pays 50 quote and receives 25 base
    OrderInfo info = make_info(true, TradeArgs{units(2), 0, false});
    FillQuote quote;
    ASSERT_EQ(quote_fill(info, QUOTE_MARKET, Wei{false, 50}, quote), OrderError::None);
    EXPECT_EQ(quote.output, (Wei{true, 25}));
    EXPECT_EQ(quote.fill_amount, 25);
}

TEST(FillPricerTest, BaseInputCountsFullInput) {
    // Sell at 2.0: the maker gives 30 base and receives 60 quote
    OrderInfo info = make_info(false, TradeArgs{units(2), 0, false});
    FillQuote quote;
    ASSERT_EQ(quote_fill(info, BASE_MARKET, Wei{false, 30}, quote), OrderError::None);
    EXPECT_EQ(quote.output, (Wei{true, 60}));
    EXPECT_EQ(quote.fill_amount, 30);
}

TEST(FillPricerTest, OutputSignOppositeToInput) {
    OrderInfo info = make_info(true, TradeArgs{units(2), 0, false});
    FillQuote quote;
    ASSERT_EQ(quote_fill(info, BASE_MARKET, Wei{true, 10}, quote), OrderError::None);
    EXPECT_FALSE(quote.output.sign);
    EXPECT_EQ(quote.output.value, 20);
}

TEST(FillPricerTest, QuoteInputRoundsDown) {
    OrderInfo info = make_info(true, TradeArgs{units(3), 0, false});
    FillQuote quote;
    ASSERT_EQ(quote_fill(info, QUOTE_MARKET, Wei{false, 10}, quote), OrderError::None);
    EXPECT_EQ(quote.output.value, 3);
    EXPECT_EQ(quote.fill_amount, 3);
}

TEST(FillPricerTest, FeeAdjustedQuote) {
    // Buy at 2.0 with a 50% positive fee: effective price 3.0
    OrderInfo info = make_info(true, TradeArgs{units(2), PRICE_BASE / 2, false});
    FillQuote quote;
    ASSERT_EQ(quote_fill(info, QUOTE_MARKET, Wei{false, 90}, quote), OrderError::None);
    EXPECT_EQ(quote.output.value, 30);
}

TEST(FillPricerTest, ZeroAdjustedPriceIsArithmeticError) {
    // A buy with a 100% negative fee prices at zero
    OrderInfo info = make_info(true, TradeArgs{units(2), PRICE_BASE, true});
    FillQuote quote;
    EXPECT_EQ(quote_fill(info, QUOTE_MARKET, Wei{false, 10}, quote), OrderError::ArithmeticError);
}

TEST(FillPricerTest, OverflowingBaseInputIsArithmeticError) {
    OrderInfo info = make_info(false, TradeArgs{units(2), 0, false});
    FillQuote quote;
    EXPECT_EQ(quote_fill(info, BASE_MARKET, Wei{false, max_uint256()}, quote),
              OrderError::ArithmeticError);
}

// --- record_fill ---

TEST(FillPricerTest, RecordFillAccumulates) {
    OrderStore store;
    OrderInfo info = make_info(true, TradeArgs{units(2), 0, false});
    Uint256 total;
    {
        OrderStore::Transaction txn(store);
        ASSERT_EQ(record_fill(txn, info, 25, total), OrderError::None);
        EXPECT_EQ(total, 25);
        txn.commit();
    }
    {
        OrderStore::Transaction txn(store);
        ASSERT_EQ(record_fill(txn, info, 75, total), OrderError::None);
        EXPECT_EQ(total, 100);
        txn.commit();
    }
    EXPECT_EQ(store.filled_amount(info.order_hash), 100);
}

TEST(FillPricerTest, OverfillRejectedAndUntouched) {
    OrderStore store;
    OrderInfo info = make_info(true, TradeArgs{units(2), 0, false});
    Uint256 total;
    {
        OrderStore::Transaction txn(store);
        ASSERT_EQ(record_fill(txn, info, 25, total), OrderError::None);
        txn.commit();
    }

    OrderStore::Transaction txn(store);
    total = 0;
    EXPECT_EQ(record_fill(txn, info, 76, total), OrderError::Overfill);
    EXPECT_EQ(total, 0);
    EXPECT_EQ(txn.filled_amount(info.order_hash), 25);
}

TEST(FillPricerTest, RecordFillNearMaxDoesNotWrap) {
    OrderStore store;
    OrderInfo info = make_info(true, TradeArgs{units(2), 0, false}, max_uint256());
    Uint256 total;
    OrderStore::Transaction txn(store);
    ASSERT_EQ(record_fill(txn, info, max_uint256(), total), OrderError::None);
    EXPECT_EQ(record_fill(txn, info, 1, total), OrderError::Overfill);
}
