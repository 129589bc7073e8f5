#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "infra/cache/InventoryCache.h"

namespace {

InventoryLedger SampleLedger() {
    InventoryLedger::Record r;
    r.id = 12;
    r.key = StockKey::Of("SKU-7", "xl");
    r.quantityAvailable = 9;
    r.quantityReserved = 3;
    r.minimumStockLevel = 2;
    r.reorderPoint = 4;
    r.lastUpdated = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    r.version = 5;
    return InventoryLedger::FromRecord(r);
}

}  // namespace

TEST(InventoryCacheTest, SnapshotKeepsEveryCounter) {
    auto restored = InventoryCache::DeserializeLedger(InventoryCache::SerializeLedger(SampleLedger()));
    ASSERT_TRUE(restored);
    EXPECT_EQ(restored->id(), 12);
    EXPECT_EQ(restored->key(), StockKey::Of("SKU-7", "xl"));
    EXPECT_EQ(restored->quantityAvailable(), 9);
    EXPECT_EQ(restored->quantityReserved(), 3);
    EXPECT_EQ(restored->reorderPoint(), 4);
    EXPECT_EQ(restored->version(), 5);
    EXPECT_EQ(restored->lastUpdated(), SampleLedger().lastUpdated());
}

TEST(InventoryCacheTest, MalformedSnapshotIsMiss) {
    EXPECT_FALSE(InventoryCache::DeserializeLedger("").has_value());
    EXPECT_FALSE(InventoryCache::DeserializeLedger("[1,2,3]").has_value());
    EXPECT_FALSE(InventoryCache::DeserializeLedger(R"({"id":1,"productRef":"A"})").has_value());
    EXPECT_FALSE(InventoryCache::DeserializeLedger(R"({"id":"x","productRef":"A","quantityAvailable":1,"quantityReserved":0,)"
                                                   R"("minimumStockLevel":1,"reorderPoint":1,"lastUpdated":0,"version":0})")
                     .has_value());
}

TEST(InventoryCacheTest, KeysUsePrefixAndStockKey) {
    InventoryCache::Options options;
    options.keyPrefix = "inv:";
    InventoryCache cache(nullptr, options);
    EXPECT_EQ(cache.buildLedgerKey(StockKey::Of("A", "b")), "inv:ledger:A:b");
    EXPECT_EQ(cache.buildAvailabilityKey(StockKey::Of("A")), "inv:availability:A");
}

TEST(InventoryCacheTest, WithoutRedisEveryCallDegradesToMiss) {
    InventoryCache cache(nullptr, {});
    cache.PutLedger(SampleLedger());
    cache.Invalidate(SampleLedger().key());
    EXPECT_FALSE(cache.GetLedger(SampleLedger().key()).has_value());
}
