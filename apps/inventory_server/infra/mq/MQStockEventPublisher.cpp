#include "infra/mq/MQStockEventPublisher.h"

#include <cstdio>
#include <ctime>
#include <utility>

#include <nlohmann/json.hpp>

#include "EventLoop.h"
#include "LogMacros.h"
#include "MQProducer.h"

using json = nlohmann::json;

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t tt = static_cast<std::time_t>(ms / 1000);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(ms % 1000));
    return buf;
}

namespace {
json VariantJson(const StockKey& key) {
    return key.variantRef ? json(*key.variantRef) : json(nullptr);
}
}  // namespace

MQStockEventPublisher::MQStockEventPublisher(Dependencies deps, Options options) : deps_(std::move(deps)), options_(std::move(options)) {}

void MQStockEventPublisher::PublishLowStock(const InventoryLedger& ledger, Clock::time_point occurredAt) {
    publish(options_.lowStockRoutingKey, BuildLowStockPayload(ledger, occurredAt));
}

void MQStockEventPublisher::PublishStockChanged(const InventoryLedger& ledger, std::string_view operation, Clock::time_point occurredAt) {
    publish(options_.stockChangedRoutingKey, BuildStockChangedPayload(ledger, operation, occurredAt));
}

std::string MQStockEventPublisher::BuildLowStockPayload(const InventoryLedger& ledger, Clock::time_point occurredAt) {
    json j;
    j["event"] = "inventory.low_stock";
    j["productRef"] = ledger.key().productRef;
    j["variantRef"] = VariantJson(ledger.key());
    j["currentAvailable"] = ledger.quantityAvailable();
    j["reorderPoint"] = ledger.reorderPoint();
    j["minimumStockLevel"] = ledger.minimumStockLevel();
    j["occurredAt"] = FormatTimestamp(occurredAt);
    return j.dump();
}

std::string MQStockEventPublisher::BuildStockChangedPayload(const InventoryLedger& ledger, std::string_view operation, Clock::time_point occurredAt) {
    json j;
    j["event"] = "inventory.stock_changed";
    j["productRef"] = ledger.key().productRef;
    j["variantRef"] = VariantJson(ledger.key());
    j["quantityAvailable"] = ledger.quantityAvailable();
    j["quantityReserved"] = ledger.quantityReserved();
    j["operation"] = std::string(operation);
    j["occurredAt"] = FormatTimestamp(occurredAt);
    return j.dump();
}

void MQStockEventPublisher::publish(const std::string& routingKey, std::string payload) {
    if (!deps_.producer || !deps_.loop) {
        LOG_DEBUG("[MQStockEventPublisher] MQ disabled, dropping {}", routingKey);
        return;
    }
    MQProducer* producer = deps_.producer;
    deps_.loop->runInLoop([producer, exchange = options_.exchange, routingKey, payload = std::move(payload)] {
        if (!producer->publish(exchange, routingKey, payload))
            LOG_WARN("[MQStockEventPublisher] Event {} dropped", routingKey);
    });
}
