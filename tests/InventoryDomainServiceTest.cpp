#include <gtest/gtest.h>

#include <functional>
#include <limits>
#include <memory>

#include "InventoryTestSupport.h"
#include "domain/InventoryDomainService.h"
#include "domain/InventoryErrors.h"
#include "infra/memory/InMemoryInventoryStore.h"
#include "infra/memory/InMemoryProductCatalog.h"

using namespace std::chrono_literals;

class InventoryDomainServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog_.AddProduct("SKU-1");
        catalog_.AddProduct("SKU-2");

        InventoryDomainService::Dependencies deps;
        deps.store = &store_;
        deps.catalog = &catalog_;
        deps.events = &events_;
        deps.invalidator = &invalidator_;

        InventoryDomainService::Options options;
        options.retryBackoff = 0ms;
        service_ = std::make_unique<InventoryDomainService>(deps, options, [this] { return clock_.now(); });
    }

    Reservation reserve(const std::string& sku, int qty, const std::string& requester = "order-1") {
        InventoryDomainService::ReserveRequest req;
        req.productRef = sku;
        req.quantity = qty;
        req.requesterId = requester;
        return service_->ReserveStock(req);
    }

    InventoryLedger ledger(const std::string& sku) {
        auto l = store_.FindLedger(StockKey::Of(sku));
        EXPECT_TRUE(l.has_value());
        return l.value_or(InventoryLedger{});
    }

    ManualClock clock_;
    InMemoryInventoryStore store_;
    InMemoryProductCatalog catalog_;
    RecordingEventPublisher events_;
    RecordingInvalidator invalidator_;
    std::unique_ptr<InventoryDomainService> service_;
};

// ========== 预留 / 确认 / 释放 ==========

TEST_F(InventoryDomainServiceTest, ReserveThenConfirmSellsUnits) {
    service_->AdjustStock("SKU-1", std::nullopt, 100, "initial");
    auto r = reserve("SKU-1", 10);
    EXPECT_EQ(r.status(), ReservationStatus::kActive);
    EXPECT_EQ(ledger("SKU-1").quantityAvailable(), 90);
    EXPECT_EQ(ledger("SKU-1").quantityReserved(), 10);

    auto confirmed = service_->ConfirmReservation(r.id());
    EXPECT_EQ(confirmed.status(), ReservationStatus::kConfirmed);
    auto l = ledger("SKU-1");
    EXPECT_EQ(l.quantityAvailable(), 90);
    EXPECT_EQ(l.quantityReserved(), 0);
    EXPECT_EQ(l.TotalOnHand(), 90);

    auto movements = service_->ListMovementsByReference(r.id());
    ASSERT_EQ(movements.size(), 2u);
    EXPECT_EQ(movements[0].type, MovementType::kReserved);
    EXPECT_EQ(movements[1].type, MovementType::kSold);
}

TEST_F(InventoryDomainServiceTest, ReleaseRestoresAvailability) {
    service_->AdjustStock("SKU-1", std::nullopt, 50, "initial");
    auto r = reserve("SKU-1", 20);
    auto released = service_->ReleaseStock(r.id(), "cart abandoned");
    EXPECT_EQ(released.status(), ReservationStatus::kReleased);
    EXPECT_EQ(released.resolutionReason().value_or(""), "cart abandoned");
    EXPECT_EQ(ledger("SKU-1").quantityAvailable(), 50);
    EXPECT_EQ(ledger("SKU-1").quantityReserved(), 0);

    EXPECT_THROW(service_->ReleaseStock(r.id(), "again"), InvalidState);
    EXPECT_THROW(service_->ConfirmReservation(r.id()), InvalidState);
}

TEST_F(InventoryDomainServiceTest, InsufficientStockLeavesNoTrace) {
    service_->AdjustStock("SKU-1", std::nullopt, 5, "initial");
    const auto movementsBefore = store_.MovementCount();
    EXPECT_THROW(reserve("SKU-1", 6), InsufficientStock);
    EXPECT_EQ(ledger("SKU-1").quantityAvailable(), 5);
    EXPECT_EQ(store_.MovementCount(), movementsBefore);
    EXPECT_TRUE(store_.AllReservations().empty());
}

TEST_F(InventoryDomainServiceTest, ReserveValidatesInput) {
    EXPECT_THROW(reserve("SKU-1", 0), InvalidQuantity);
    EXPECT_THROW(reserve("", 1), InvalidArgument);
    EXPECT_THROW(reserve("SKU-1", 1, ""), InvalidArgument);
    EXPECT_THROW(reserve("SKU-1", 1), ProductNotTracked);
}

TEST_F(InventoryDomainServiceTest, UnknownReservationIsReported) {
    EXPECT_THROW(service_->ConfirmReservation("missing"), ReservationNotFound);
    EXPECT_THROW(service_->ReleaseStock("missing", ""), ReservationNotFound);
    EXPECT_THROW(service_->ExpireReservation("missing"), ReservationNotFound);
}

TEST_F(InventoryDomainServiceTest, TtlOverrideIsCapped) {
    service_->AdjustStock("SKU-1", std::nullopt, 10, "initial");
    const auto now = clock_.now();

    auto byDefault = reserve("SKU-1", 1);
    EXPECT_EQ(byDefault.expiresAt(), now + 30min);

    InventoryDomainService::ReserveRequest req;
    req.productRef = "SKU-1";
    req.quantity = 1;
    req.requesterId = "order-2";
    req.ttl = 48h;
    EXPECT_EQ(service_->ReserveStock(req).expiresAt(), now + 24h);

    req.ttl = 0s;
    EXPECT_EQ(service_->ReserveStock(req).expiresAt(), now + 30min);
}

// ========== 过期 ==========

TEST_F(InventoryDomainServiceTest, ExpiredReservationsAreSweptOnce) {
    service_->AdjustStock("SKU-1", std::nullopt, 10, "initial");
    auto r = reserve("SKU-1", 4);
    reserve("SKU-1", 2, "order-2");

    EXPECT_EQ(service_->CleanupExpiredReservations().expired, 0u);

    clock_.advance(31min);
    auto report = service_->CleanupExpiredReservations();
    EXPECT_EQ(report.scanned, 2u);
    EXPECT_EQ(report.expired, 2u);
    EXPECT_EQ(report.failed, 0u);
    EXPECT_EQ(ledger("SKU-1").quantityAvailable(), 10);
    EXPECT_EQ(service_->GetReservation(r.id())->status(), ReservationStatus::kExpired);

    // 二次清理没有可处理的预留
    EXPECT_EQ(service_->CleanupExpiredReservations().scanned, 0u);
    EXPECT_FALSE(service_->ExpireReservation(r.id()));
    EXPECT_THROW(service_->ConfirmReservation(r.id()), InvalidState);
}

TEST_F(InventoryDomainServiceTest, SweepSkipsConfirmedReservations) {
    service_->AdjustStock("SKU-1", std::nullopt, 10, "initial");
    auto r = reserve("SKU-1", 4);
    service_->ConfirmReservation(r.id());
    clock_.advance(2h);
    EXPECT_EQ(service_->CleanupExpiredReservations().scanned, 0u);
    EXPECT_EQ(ledger("SKU-1").TotalOnHand(), 6);
}

TEST_F(InventoryDomainServiceTest, ExpireBeforeDeadlineIsRejected) {
    service_->AdjustStock("SKU-1", std::nullopt, 10, "initial");
    auto r = reserve("SKU-1", 4);
    EXPECT_THROW(service_->ExpireReservation(r.id()), InvalidState);
    EXPECT_EQ(ledger("SKU-1").quantityReserved(), 4);
}

TEST_F(InventoryDomainServiceTest, SweepWorksAcrossBatches) {
    InventoryDomainService::Dependencies deps;
    deps.store = &store_;
    InventoryDomainService::Options options;
    options.sweepBatchSize = 3;
    InventoryDomainService small(deps, options, [this] { return clock_.now(); });

    service_->AdjustStock("SKU-1", std::nullopt, 100, "initial");
    for (int i = 0; i < 7; ++i)
        reserve("SKU-1", 1, "order-" + std::to_string(i));
    clock_.advance(1h);

    auto report = small.CleanupExpiredReservations();
    EXPECT_EQ(report.expired, 7u);
    EXPECT_EQ(ledger("SKU-1").quantityAvailable(), 100);
}

// ========== 盘点与低库存 ==========

TEST_F(InventoryDomainServiceTest, AdjustCreatesLedgerAndRecordsMovement) {
    auto l = service_->AdjustStock("SKU-2", std::string("red"), 40, "receiving", std::string("alice"));
    EXPECT_EQ(l.quantityAvailable(), 40);
    EXPECT_EQ(l.minimumStockLevel(), InventoryLedger::kDefaultMinimumStockLevel);

    auto movements = service_->ListMovements("SKU-2", std::string("red"), 10);
    ASSERT_EQ(movements.size(), 1u);
    EXPECT_EQ(movements[0].type, MovementType::kIncoming);
    EXPECT_EQ(movements[0].quantityChange, 40);
    EXPECT_EQ(movements[0].actor.value_or(""), "alice");

    l = service_->AdjustStock("SKU-2", std::string("red"), 25, "shrinkage");
    EXPECT_EQ(l.quantityAvailable(), 25);
    movements = service_->ListMovements("SKU-2", std::string("red"), 10);
    ASSERT_EQ(movements.size(), 2u);
    EXPECT_EQ(movements[0].type, MovementType::kOutgoing);
    EXPECT_EQ(movements[0].quantityChange, 15);
}

TEST_F(InventoryDomainServiceTest, AdjustMagnitudeAccountsForReservations) {
    service_->AdjustStock("SKU-1", std::nullopt, 20, "initial");
    reserve("SKU-1", 5);
    auto l = service_->AdjustStock("SKU-1", std::nullopt, 30, "restock");
    EXPECT_EQ(l.quantityAvailable(), 25);
    EXPECT_EQ(l.quantityReserved(), 5);
    auto movements = service_->ListMovements("SKU-1", std::nullopt, 1);
    ASSERT_EQ(movements.size(), 1u);
    EXPECT_EQ(movements[0].quantityChange, 10);

    EXPECT_THROW(service_->AdjustStock("SKU-1", std::nullopt, 4, "too low"), InvalidAdjustment);
    EXPECT_THROW(service_->AdjustStock("SKU-1", std::nullopt, -1, "negative"), InvalidAdjustment);
}

TEST_F(InventoryDomainServiceTest, AdjustToSameTotalIsNoOp) {
    service_->AdjustStock("SKU-1", std::nullopt, 20, "initial");
    const auto movements = store_.MovementCount();
    const auto version = ledger("SKU-1").version();
    events_.clear();

    service_->AdjustStock("SKU-1", std::nullopt, 20, "recount");
    EXPECT_EQ(store_.MovementCount(), movements);
    EXPECT_EQ(ledger("SKU-1").version(), version);
    EXPECT_TRUE(events_.events().empty());
}

TEST_F(InventoryDomainServiceTest, AdjustUnknownProductFails) {
    EXPECT_THROW(service_->AdjustStock("NOPE", std::nullopt, 10, "initial"), ProductNotFound);
    EXPECT_EQ(store_.LedgerCount(), 0u);
}

TEST_F(InventoryDomainServiceTest, LowStockEventAfterConfirmAndAdjust) {
    service_->AdjustStock("SKU-1", std::nullopt, 15, "initial");
    EXPECT_EQ(events_.count("low_stock"), 0u);

    auto r = reserve("SKU-1", 6);
    // 预留本身不触发低库存
    EXPECT_EQ(events_.count("low_stock"), 0u);
    service_->ConfirmReservation(r.id());
    EXPECT_EQ(events_.count("low_stock"), 1u);

    service_->AdjustStock("SKU-1", std::nullopt, 3, "damage");
    EXPECT_EQ(events_.count("low_stock"), 2u);

    service_->AdjustStock("SKU-1", std::nullopt, 100, "restock");
    EXPECT_EQ(events_.count("low_stock"), 2u);
}

TEST_F(InventoryDomainServiceTest, EveryCommitInvalidatesCacheAndPublishesChange) {
    service_->AdjustStock("SKU-1", std::string("xl"), 10, "initial");
    InventoryDomainService::ReserveRequest req;
    req.productRef = "SKU-1";
    req.variantRef = "xl";
    req.quantity = 2;
    req.requesterId = "order-1";
    auto r = service_->ReserveStock(req);
    service_->ReleaseStock(r.id(), "");

    auto keys = invalidator_.keys();
    ASSERT_EQ(keys.size(), 3u);
    for (const auto& k : keys)
        EXPECT_EQ(k, "SKU-1:xl");

    std::vector<std::string> ops;
    for (const auto& e : events_.events())
        if (e.kind == "stock_changed")
            ops.push_back(e.operation);
    EXPECT_EQ(ops, (std::vector<std::string>{"adjust", "reserve", "release"}));
}

TEST_F(InventoryDomainServiceTest, CorrectStockAppliesDelta) {
    service_->AdjustStock("SKU-1", std::nullopt, 20, "initial");
    auto l = service_->CorrectStock("SKU-1", std::nullopt, -3, "miscount");
    EXPECT_EQ(l.quantityAvailable(), 17);
    auto movements = service_->ListMovements("SKU-1", std::nullopt, 1);
    EXPECT_EQ(movements.front().type, MovementType::kAdjustmentOut);
    EXPECT_EQ(movements.front().quantityChange, 3);

    EXPECT_THROW(service_->CorrectStock("SKU-1", std::nullopt, 0, "noop"), InvalidQuantity);
    EXPECT_THROW(service_->CorrectStock("SKU-1", std::nullopt, -18, "too many"), InvalidAdjustment);
    EXPECT_THROW(service_->CorrectStock("SKU-2", std::nullopt, 1, "untracked"), ProductNotTracked);
}

TEST_F(InventoryDomainServiceTest, CorrectStockRejectsOutOfRangeTotals) {
    service_->AdjustStock("SKU-1", std::nullopt, 10, "initial");
    const auto movements = store_.MovementCount();

    EXPECT_THROW(service_->CorrectStock("SKU-1", std::nullopt, std::numeric_limits<int>::max(), "overflow"), InvalidAdjustment);
    EXPECT_THROW(service_->CorrectStock("SKU-1", std::nullopt, std::numeric_limits<int>::min(), "underflow"), InvalidAdjustment);

    EXPECT_EQ(ledger("SKU-1").TotalOnHand(), 10);
    EXPECT_EQ(store_.MovementCount(), movements);

    // 恰好到上限是允许的
    auto l = service_->CorrectStock("SKU-1", std::nullopt, std::numeric_limits<int>::max() - 10, "fill");
    EXPECT_EQ(l.TotalOnHand(), std::numeric_limits<int>::max());
}

TEST_F(InventoryDomainServiceTest, UpdateThresholdsWritesNoMovement) {
    service_->AdjustStock("SKU-1", std::nullopt, 20, "initial");
    const auto movements = store_.MovementCount();
    auto l = service_->UpdateThresholds("SKU-1", std::nullopt, 2, 25);
    EXPECT_EQ(l.reorderPoint(), 25);
    EXPECT_TRUE(l.IsLowStock());
    EXPECT_EQ(store_.MovementCount(), movements);
    EXPECT_EQ(events_.count("low_stock"), 0u);
}

// ========== 查询 ==========

TEST_F(InventoryDomainServiceTest, QueriesReflectLedgerState) {
    service_->AdjustStock("SKU-1", std::nullopt, 8, "initial");
    service_->AdjustStock("SKU-2", std::nullopt, 0, "initial");
    reserve("SKU-1", 3, "order-7");

    EXPECT_TRUE(service_->IsStockAvailable("SKU-1", std::nullopt, 5));
    EXPECT_FALSE(service_->IsStockAvailable("SKU-1", std::nullopt, 6));
    EXPECT_FALSE(service_->IsStockAvailable("SKU-1", std::nullopt, 0));
    EXPECT_FALSE(service_->IsStockAvailable("UNKNOWN", std::nullopt, 1));
    EXPECT_EQ(service_->GetAvailableQuantity("SKU-1"), 5);
    EXPECT_EQ(service_->GetAvailableQuantity("UNKNOWN"), 0);
    EXPECT_FALSE(service_->GetInventory("UNKNOWN").has_value());

    EXPECT_EQ(service_->ListActiveReservations("order-7").size(), 1u);
    EXPECT_TRUE(service_->ListActiveReservations("nobody").empty());

    auto levels = service_->BulkStockCheck({{"SKU-1", std::nullopt, 5}, {"SKU-2", std::nullopt, 1}, {"GHOST", std::nullopt, 1}});
    ASSERT_EQ(levels.size(), 3u);
    EXPECT_TRUE(levels[0].inStock);
    EXPECT_FALSE(levels[1].inStock);
    EXPECT_TRUE(levels[1].tracked);
    EXPECT_FALSE(levels[2].tracked);

    auto outOfStock = service_->ListLedgers(LedgerFilter::kOutOfStock);
    ASSERT_EQ(outOfStock.size(), 1u);
    EXPECT_EQ(outOfStock[0].key().productRef, "SKU-2");
    EXPECT_EQ(service_->ListLedgers(LedgerFilter::kWithReservations).size(), 1u);
    EXPECT_EQ(service_->ListLedgers(LedgerFilter::kLowStock).size(), 2u);
}

TEST_F(InventoryDomainServiceTest, GetInventoryUsesSnapshotCache) {
    MapSnapshotCache snapshots;
    InventoryDomainService::Dependencies deps;
    deps.store = &store_;
    deps.snapshots = &snapshots;
    InventoryDomainService cached(deps);

    service_->AdjustStock("SKU-1", std::nullopt, 8, "initial");
    ASSERT_TRUE(cached.GetInventory("SKU-1").has_value());
    EXPECT_EQ(snapshots.hits(), 0);
    EXPECT_EQ(cached.GetInventory("SKU-1")->quantityAvailable(), 8);
    EXPECT_EQ(snapshots.hits(), 1);
}

namespace {

// 回填快照前插入一次写入：写入方提交并失效缓存后，旧快照才落进缓存
class RacingSnapshotCache : public MapSnapshotCache, public StockCacheInvalidator {
public:
    void PutLedger(const InventoryLedger& ledger) override {
        if (beforePut) {
            auto hook = std::move(beforePut);
            beforePut = nullptr;
            hook();
        }
        MapSnapshotCache::PutLedger(ledger);
    }

    void Invalidate(const StockKey& key) override {
        ++invalidations;
        Erase(key);
    }

    std::function<void()> beforePut;
    int invalidations{0};
};

}  // namespace

TEST_F(InventoryDomainServiceTest, GetInventoryDropsSnapshotOverwrittenByConcurrentWrite) {
    RacingSnapshotCache cache;
    InventoryDomainService::Dependencies deps;
    deps.store = &store_;
    deps.snapshots = &cache;
    deps.invalidator = &cache;
    InventoryDomainService cached(deps);

    cached.AdjustStock("SKU-1", std::nullopt, 8, "initial");
    const int invalidationsAfterSetup = cache.invalidations;
    cache.beforePut = [&] { cached.AdjustStock("SKU-1", std::nullopt, 3, "recount"); };

    auto first = cached.GetInventory("SKU-1");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->quantityAvailable(), 3);
    // 写入方一次，回填复核一次
    EXPECT_EQ(cache.invalidations, invalidationsAfterSetup + 2);

    // 缓存里不能留下 8 的旧快照
    auto second = cached.GetInventory("SKU-1");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->quantityAvailable(), 3);
}

TEST(InventoryDomainServiceConstructionTest, RequiresStore) {
    EXPECT_THROW(std::make_unique<InventoryDomainService>(InventoryDomainService::Dependencies{}), std::invalid_argument);
}
