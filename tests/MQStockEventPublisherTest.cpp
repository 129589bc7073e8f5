#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "infra/mq/MQStockEventPublisher.h"

using json = nlohmann::json;

namespace {

InventoryLedger LowLedger() {
    InventoryLedger::Record r;
    r.id = 1;
    r.key = StockKey::Of("SKU-3");
    r.quantityAvailable = 2;
    r.quantityReserved = 1;
    r.minimumStockLevel = 5;
    r.reorderPoint = 10;
    return InventoryLedger::FromRecord(r);
}

const auto kOccurredAt = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));

}  // namespace

TEST(MQStockEventPublisherTest, FormatsTimestampAsUtcIso8601) {
    EXPECT_EQ(FormatTimestamp(kOccurredAt), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(FormatTimestamp(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00.000Z");
}

TEST(MQStockEventPublisherTest, LowStockPayload) {
    auto j = json::parse(MQStockEventPublisher::BuildLowStockPayload(LowLedger(), kOccurredAt));
    EXPECT_EQ(j["event"], "inventory.low_stock");
    EXPECT_EQ(j["productRef"], "SKU-3");
    EXPECT_TRUE(j["variantRef"].is_null());
    EXPECT_EQ(j["currentAvailable"], 2);
    EXPECT_EQ(j["reorderPoint"], 10);
    EXPECT_EQ(j["minimumStockLevel"], 5);
    EXPECT_EQ(j["occurredAt"], "2023-11-14T22:13:20.123Z");
}

TEST(MQStockEventPublisherTest, StockChangedPayload) {
    auto j = json::parse(MQStockEventPublisher::BuildStockChangedPayload(LowLedger(), "confirm", kOccurredAt));
    EXPECT_EQ(j["event"], "inventory.stock_changed");
    EXPECT_EQ(j["operation"], "confirm");
    EXPECT_EQ(j["quantityAvailable"], 2);
    EXPECT_EQ(j["quantityReserved"], 1);
}

TEST(MQStockEventPublisherTest, PublishingWithoutBrokerIsDropped) {
    MQStockEventPublisher publisher(MQStockEventPublisher::Dependencies{}, MQStockEventPublisher::Options{});
    EXPECT_NO_THROW(publisher.PublishLowStock(LowLedger(), kOccurredAt));
    EXPECT_NO_THROW(publisher.PublishStockChanged(LowLedger(), "adjust", kOccurredAt));
}
