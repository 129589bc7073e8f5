#include <gtest/gtest.h>

#include "domain/InventoryErrors.h"
#include "domain/InventoryLedger.h"

namespace {

using Clock = InventoryLedger::Clock;

InventoryLedger MakeLedger(int total, int minimum = 5, int reorder = 10) {
    InventoryLedger ledger(StockKey::Of("SKU-1"), minimum, reorder, Clock::now());
    ledger.SetId(1);
    ledger.AdjustTotalTo(total);
    return ledger;
}

}  // namespace

TEST(StockKeyTest, EmptyVariantNormalizesToNone) {
    EXPECT_EQ(StockKey::Of("A", ""), StockKey::Of("A"));
    EXPECT_FALSE(StockKey::Of("A", "").variantRef.has_value());
    EXPECT_EQ(StockKey::Of("A", "red").ToString(), "A:red");
    EXPECT_EQ(StockKey::Of("A").ToString(), "A");
    EXPECT_NE(StockKeyHash{}(StockKey::Of("A", "red")), StockKeyHash{}(StockKey::Of("A", "blue")));
}

TEST(InventoryLedgerTest, ReserveMovesAvailableToReserved) {
    auto ledger = MakeLedger(100);
    ledger.Reserve(30);
    EXPECT_EQ(ledger.quantityAvailable(), 70);
    EXPECT_EQ(ledger.quantityReserved(), 30);
    EXPECT_EQ(ledger.TotalOnHand(), 100);
}

TEST(InventoryLedgerTest, ReserveMoreThanAvailableThrowsAndLeavesStateUnchanged) {
    auto ledger = MakeLedger(10);
    try {
        ledger.Reserve(11);
        FAIL() << "expected InsufficientStock";
    } catch (const InsufficientStock& e) {
        EXPECT_EQ(e.requested(), 11);
        EXPECT_EQ(e.available(), 10);
        EXPECT_EQ(e.code(), InventoryErrc::kInsufficientStock);
        EXPECT_FALSE(e.IsTransient());
    }
    EXPECT_EQ(ledger.quantityAvailable(), 10);
    EXPECT_EQ(ledger.quantityReserved(), 0);
}

TEST(InventoryLedgerTest, CanReserveRejectsNonPositive) {
    auto ledger = MakeLedger(10);
    EXPECT_FALSE(ledger.CanReserve(0));
    EXPECT_FALSE(ledger.CanReserve(-1));
    EXPECT_TRUE(ledger.CanReserve(10));
    EXPECT_FALSE(ledger.CanReserve(11));
}

TEST(InventoryLedgerTest, ReleaseReturnsReservedToAvailable) {
    auto ledger = MakeLedger(20);
    ledger.Reserve(8);
    ledger.Release(5);
    EXPECT_EQ(ledger.quantityAvailable(), 17);
    EXPECT_EQ(ledger.quantityReserved(), 3);
    EXPECT_THROW(ledger.Release(4), InvalidRelease);
    EXPECT_THROW(ledger.Release(0), InvalidRelease);
}

TEST(InventoryLedgerTest, ConfirmSaleRemovesUnitsFromHand) {
    auto ledger = MakeLedger(20);
    ledger.Reserve(8);
    ledger.ConfirmSale(8);
    EXPECT_EQ(ledger.quantityAvailable(), 12);
    EXPECT_EQ(ledger.quantityReserved(), 0);
    EXPECT_EQ(ledger.TotalOnHand(), 12);
    EXPECT_THROW(ledger.ConfirmSale(1), InvalidConfirm);
}

TEST(InventoryLedgerTest, AdjustTotalKeepsReservations) {
    auto ledger = MakeLedger(20);
    ledger.Reserve(5);
    ledger.AdjustTotalTo(50);
    EXPECT_EQ(ledger.quantityAvailable(), 45);
    EXPECT_EQ(ledger.quantityReserved(), 5);

    EXPECT_THROW(ledger.AdjustTotalTo(4), InvalidAdjustment);
    EXPECT_THROW(ledger.AdjustTotalTo(-1), InvalidAdjustment);
    EXPECT_EQ(ledger.quantityAvailable(), 45);
}

TEST(InventoryLedgerTest, StockLevelPredicates) {
    auto ledger = MakeLedger(11, 5, 10);
    EXPECT_FALSE(ledger.IsLowStock());
    ledger.Reserve(1);
    EXPECT_TRUE(ledger.IsLowStock());  // available == reorderPoint
    EXPECT_FALSE(ledger.IsBelowMinimum());
    ledger.Reserve(6);
    EXPECT_TRUE(ledger.IsBelowMinimum());
    ledger.Reserve(4);
    EXPECT_TRUE(ledger.IsOutOfStock());
}

TEST(InventoryLedgerTest, ThresholdsMustBeNonNegative) {
    auto ledger = MakeLedger(10);
    EXPECT_THROW(ledger.SetThresholds(-1, 3), InvalidAdjustment);
    ledger.SetThresholds(2, 3);
    EXPECT_EQ(ledger.minimumStockLevel(), 2);
    EXPECT_EQ(ledger.reorderPoint(), 3);
}

TEST(InventoryLedgerTest, RecordRoundTripKeepsVersion) {
    auto ledger = MakeLedger(10);
    ledger.SetVersion(7);
    auto copy = InventoryLedger::FromRecord(ledger.ToRecord());
    EXPECT_EQ(copy.id(), 1);
    EXPECT_EQ(copy.version(), 7);
    EXPECT_EQ(copy.quantityAvailable(), 10);
    EXPECT_EQ(copy.key(), ledger.key());
}
