#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

#include "domain/InventoryErrors.h"
#include "infra/memory/InMemoryInventoryStore.h"

using namespace std::chrono_literals;

namespace {

using Clock = InventoryStore::Clock;

InventoryLedger Seed(InMemoryInventoryStore& store, const StockKey& key, int total) {
    TransactionScope tx(store);
    auto ledger = tx->InsertLedger(InventoryLedger(key, 5, 10, Clock::now()));
    ledger.AdjustTotalTo(total);
    tx->UpdateLedger(ledger);
    tx.Commit();
    return ledger;
}

}  // namespace

TEST(InMemoryInventoryStoreTest, RollbackDiscardsStagedWrites) {
    InMemoryInventoryStore store;
    const auto key = StockKey::Of("SKU-1");
    Seed(store, key, 10);
    {
        TransactionScope tx(store);
        auto ledger = tx->LockLedger(key);
        ASSERT_TRUE(ledger);
        ledger->Reserve(4);
        tx->UpdateLedger(*ledger);
        auto movement = StockMovement::Of(*ledger, MovementType::kReserved, 4, "test", std::nullopt, std::nullopt, Clock::now());
        tx->AppendMovement(movement);
        // 未提交，析构时回滚
    }
    auto ledger = store.FindLedger(key);
    ASSERT_TRUE(ledger);
    EXPECT_EQ(ledger->quantityAvailable(), 10);
    EXPECT_EQ(store.MovementCount(), 0u);
}

TEST(InMemoryInventoryStoreTest, UnitOfWorkSeesItsOwnWrites) {
    InMemoryInventoryStore store;
    const auto key = StockKey::Of("SKU-1", "m");
    TransactionScope tx(store);
    EXPECT_FALSE(tx->LockLedger(key).has_value());
    auto ledger = tx->InsertLedger(InventoryLedger(key, 5, 10, Clock::now()));
    EXPECT_GT(ledger.id(), 0);
    EXPECT_TRUE(tx->LockLedger(key).has_value());
    EXPECT_TRUE(tx->LockLedgerById(ledger.id()).has_value());
    // 其他读者在提交前看不到
    EXPECT_FALSE(store.FindLedger(key).has_value());
    tx.Commit();
    EXPECT_TRUE(store.FindLedger(key).has_value());
    EXPECT_EQ(store.LedgerCount(), 1u);
}

TEST(InMemoryInventoryStoreTest, StaleVersionIsConflict) {
    InMemoryInventoryStore store;
    const auto key = StockKey::Of("SKU-1");
    auto stale = Seed(store, key, 10);
    stale.SetVersion(stale.version() - 1);

    TransactionScope tx(store);
    ASSERT_TRUE(tx->LockLedger(key));
    EXPECT_THROW(tx->UpdateLedger(stale), ConcurrencyConflict);
}

TEST(InMemoryInventoryStoreTest, DuplicateLedgerInsertIsConflict) {
    InMemoryInventoryStore store;
    const auto key = StockKey::Of("SKU-1");
    Seed(store, key, 1);

    TransactionScope tx(store);
    ASSERT_TRUE(tx->LockLedger(key));
    EXPECT_THROW(tx->InsertLedger(InventoryLedger(key, 5, 10, Clock::now())), ConcurrencyConflict);
}

TEST(InMemoryInventoryStoreTest, UpdatingResolvedReservationIsConflict) {
    InMemoryInventoryStore store;
    const auto key = StockKey::Of("SKU-1");
    Seed(store, key, 10);

    std::string id;
    {
        TransactionScope tx(store);
        auto ledger = tx->LockLedger(key);
        auto r = Reservation::Create(*ledger, 2, "order-1", std::nullopt, std::nullopt, Clock::now(), 30min);
        tx->UpdateLedger(*ledger);
        tx->InsertReservation(r);
        tx.Commit();
        id = r.id();
    }
    auto snapshot = store.FindReservation(id);
    ASSERT_TRUE(snapshot);
    {
        TransactionScope tx(store);
        auto r = tx->LockReservation(id);
        auto ledger = tx->LockLedgerById(r->ledgerId());
        r->Confirm(*ledger, Clock::now());
        tx->UpdateLedger(*ledger);
        tx->UpdateReservation(*r);
        tx.Commit();
    }

    // 过期视图上的写入被拒绝
    TransactionScope tx(store);
    ASSERT_TRUE(tx->LockReservation(id));
    EXPECT_THROW(tx->UpdateReservation(*snapshot), ConcurrencyConflict);
}

TEST(InMemoryInventoryStoreTest, WriteWithoutLockIsLogicError) {
    InMemoryInventoryStore store;
    TransactionScope tx(store);
    EXPECT_THROW(tx->InsertLedger(InventoryLedger(StockKey::Of("SKU-1"), 5, 10, Clock::now())), std::logic_error);
}

TEST(InMemoryInventoryStoreTest, LockBlocksSecondUnitOfWorkUntilCommit) {
    InMemoryInventoryStore store;
    const auto key = StockKey::Of("SKU-1");
    Seed(store, key, 10);

    auto first = std::make_unique<TransactionScope>(store);
    ASSERT_TRUE((*first)->LockLedger(key));

    std::atomic<bool> acquired{false};
    auto second = std::async(std::launch::async, [&] {
        TransactionScope tx(store);
        auto ledger = tx->LockLedger(key);
        acquired = true;
        return ledger->quantityAvailable();
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());

    auto ledger = (*first)->LockLedger(key);
    ledger->Reserve(3);
    (*first)->UpdateLedger(*ledger);
    first->Commit();
    first.reset();

    EXPECT_EQ(second.get(), 7);
    EXPECT_TRUE(acquired.load());
}

TEST(InMemoryInventoryStoreTest, ExpiredReservationsOrderedByDeadline) {
    InMemoryInventoryStore store;
    const auto key = StockKey::Of("SKU-1");
    Seed(store, key, 10);
    const auto now = Clock::now();
    {
        TransactionScope tx(store);
        auto ledger = tx->LockLedger(key);
        auto late = Reservation::Create(*ledger, 1, "a", std::nullopt, std::nullopt, now, 20min);
        auto early = Reservation::Create(*ledger, 1, "b", std::nullopt, std::nullopt, now, 10min);
        auto fresh = Reservation::Create(*ledger, 1, "c", std::nullopt, std::nullopt, now, 2h);
        tx->UpdateLedger(*ledger);
        tx->InsertReservation(late);
        tx->InsertReservation(early);
        tx->InsertReservation(fresh);
        tx.Commit();
    }
    auto expired = store.FindExpiredReservations(now + 1h, 10, std::nullopt);
    ASSERT_EQ(expired.size(), 2u);
    EXPECT_EQ(expired[0].requesterId(), "b");
    EXPECT_EQ(expired[1].requesterId(), "a");
    EXPECT_EQ(store.FindExpiredReservations(now + 1h, 1, std::nullopt).size(), 1u);

    auto next = store.FindExpiredReservations(now + 1h, 10, ExpiryCursor{expired[0].expiresAt(), expired[0].id()});
    ASSERT_EQ(next.size(), 1u);
    EXPECT_EQ(next[0].requesterId(), "a");
    EXPECT_TRUE(store.FindExpiredReservations(now + 1h, 10, ExpiryCursor{expired[1].expiresAt(), expired[1].id()}).empty());
}
