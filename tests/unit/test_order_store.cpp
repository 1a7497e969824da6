#include <gtest/gtest.h>
#include "orders/order_store.hpp"
#include "crypto/keccak.hpp"

using namespace canonical;

namespace {

OrderHash hash_of(const char* label) {
    return keccak256(label);
}

} // anonymous namespace

TEST(OrderStoreTest, UnknownOrderIsNull) {
    OrderStore store;
    OrderState state = store.state(hash_of("never seen"));
    EXPECT_EQ(state.status, OrderStatus::Null);
    EXPECT_EQ(state.filled_amount, 0);
    EXPECT_EQ(store.tracked_orders(), 0u);
}

TEST(OrderStoreTest, InitialOperationalFlag) {
    EXPECT_TRUE(OrderStore().operational());
    EXPECT_FALSE(OrderStore(false).operational());
}

TEST(OrderStoreTest, CommitPublishesWrites) {
    OrderStore store;
    OrderHash a = hash_of("a");
    OrderHash b = hash_of("b");

    OrderStore::Transaction txn(store);
    txn.set_status(a, OrderStatus::Approved);
    txn.set_filled_amount(b, 250);
    txn.set_operational(false);
    txn.set_transient_trade_args(TradeArgs{100, 1, true});

    // Nothing visible before commit
    EXPECT_EQ(store.status(a), OrderStatus::Null);
    EXPECT_EQ(store.filled_amount(b), 0);
    EXPECT_TRUE(store.operational());

    txn.commit();
    EXPECT_TRUE(txn.committed());
    EXPECT_EQ(store.status(a), OrderStatus::Approved);
    EXPECT_EQ(store.filled_amount(b), 250);
    EXPECT_FALSE(store.operational());
    EXPECT_EQ(store.transient_trade_args(), (TradeArgs{100, 1, true}));
    EXPECT_EQ(store.tracked_orders(), 2u);
}

TEST(OrderStoreTest, DroppedTransactionLeavesNoTrace) {
    OrderStore store;
    OrderHash a = hash_of("a");
    {
        OrderStore::Transaction txn(store);
        txn.set_status(a, OrderStatus::Canceled);
        txn.set_filled_amount(a, 7);
        txn.set_operational(false);
    }
    EXPECT_EQ(store.status(a), OrderStatus::Null);
    EXPECT_EQ(store.filled_amount(a), 0);
    EXPECT_TRUE(store.operational());
    EXPECT_EQ(store.tracked_orders(), 0u);
}

TEST(OrderStoreTest, TransactionReadsThrough) {
    OrderStore store;
    OrderHash a = hash_of("a");
    {
        OrderStore::Transaction txn(store);
        txn.set_filled_amount(a, 10);
        txn.commit();
    }

    OrderStore::Transaction txn(store);
    EXPECT_EQ(txn.filled_amount(a), 10);
    EXPECT_EQ(txn.status(a), OrderStatus::Null);
    EXPECT_TRUE(txn.operational());

    txn.set_filled_amount(a, 30);
    EXPECT_EQ(txn.filled_amount(a), 30);
    EXPECT_EQ(store.filled_amount(a), 10);
}

TEST(OrderStoreTest, TakeTransientTradeArgsClearsSlot) {
    OrderStore store;
    {
        OrderStore::Transaction txn(store);
        txn.set_transient_trade_args(TradeArgs{500, 2, false});
        txn.commit();
    }

    OrderStore::Transaction txn(store);
    EXPECT_EQ(txn.take_transient_trade_args(), (TradeArgs{500, 2, false}));
    EXPECT_EQ(txn.take_transient_trade_args(), TradeArgs{});

    // Slot still set in the store until the read commits
    EXPECT_EQ(store.transient_trade_args().price, 500);
    txn.commit();
    EXPECT_EQ(store.transient_trade_args(), TradeArgs{});
}

TEST(OrderStoreTest, TakeWithinSameTransaction) {
    OrderStore store;
    OrderStore::Transaction txn(store);
    txn.set_transient_trade_args(TradeArgs{9, 0, false});
    EXPECT_EQ(txn.take_transient_trade_args().price, 9);
    EXPECT_EQ(txn.take_transient_trade_args().price, 0);
}

TEST(OrderStoreTest, CommitIsIdempotent) {
    OrderStore store;
    OrderHash a = hash_of("a");
    OrderStore::Transaction txn(store);
    txn.set_status(a, OrderStatus::Approved);
    txn.commit();
    txn.commit();
    EXPECT_EQ(store.status(a), OrderStatus::Approved);
}
