#include "infra/cache/InventoryCache.h"

#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "LogMacros.h"
#include "RedisPool.h"

using json = nlohmann::json;

namespace {
std::int64_t ToEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}
}  // namespace

// ========== 构造函数 ==========

InventoryCache::InventoryCache(std::shared_ptr<RedisPool> pool, Options options) : pool_(std::move(pool)), options_(std::move(options)) {}

// ========== 核心接口 ==========

void InventoryCache::Invalidate(const StockKey& key) {
    if (!pool_)
        return;
    auto client = pool_->GetClient();
    if (!client) {
        LOG_WARN("[InventoryCache] Redis unavailable, {} not invalidated", key.ToString());
        return;
    }
    std::vector<std::string> keys{buildLedgerKey(key), buildAvailabilityKey(key)};
    if (!client->Del(keys))
        LOG_WARN("[InventoryCache] DEL failed for {}", key.ToString());
}

std::optional<InventoryLedger> InventoryCache::GetLedger(const StockKey& key) {
    if (!pool_)
        return std::nullopt;
    auto client = pool_->GetClient();
    if (!client)
        return std::nullopt;

    std::string payload;
    if (!client->Get(buildLedgerKey(key), payload))
        return std::nullopt;
    auto ledger = DeserializeLedger(payload);
    if (!ledger) {
        LOG_WARN("[InventoryCache] Dropping malformed snapshot for {}", key.ToString());
        if (!client->Del(buildLedgerKey(key)))
            LOG_DEBUG("[InventoryCache] DEL failed for {}", key.ToString());
    }
    return ledger;
}

void InventoryCache::PutLedger(const InventoryLedger& ledger) {
    if (!pool_)
        return;
    auto client = pool_->GetClient();
    if (!client)
        return;
    if (!client->SetEx(buildLedgerKey(ledger.key()), SerializeLedger(ledger), options_.ttl) ||
        !client->SetEx(buildAvailabilityKey(ledger.key()), std::to_string(ledger.quantityAvailable()), options_.ttl)) {
        LOG_DEBUG("[InventoryCache] SET failed for {}", ledger.key().ToString());
    }
}

// ========== 键与序列化 ==========

std::string InventoryCache::buildLedgerKey(const StockKey& key) const {
    return options_.keyPrefix + "ledger:" + key.ToString();
}

std::string InventoryCache::buildAvailabilityKey(const StockKey& key) const {
    return options_.keyPrefix + "availability:" + key.ToString();
}

std::string InventoryCache::SerializeLedger(const InventoryLedger& ledger) {
    json j;
    j["id"] = ledger.id();
    j["productRef"] = ledger.key().productRef;
    j["variantRef"] = ledger.key().variantRef ? json(*ledger.key().variantRef) : json(nullptr);
    j["quantityAvailable"] = ledger.quantityAvailable();
    j["quantityReserved"] = ledger.quantityReserved();
    j["minimumStockLevel"] = ledger.minimumStockLevel();
    j["reorderPoint"] = ledger.reorderPoint();
    j["lastUpdated"] = ToEpochMillis(ledger.lastUpdated());
    j["version"] = ledger.version();
    return j.dump();
}

std::optional<InventoryLedger> InventoryCache::DeserializeLedger(std::string_view payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    try {
        InventoryLedger::Record r;
        r.id = j.at("id").get<std::int64_t>();
        std::optional<std::string> variant;
        if (j.contains("variantRef") && j["variantRef"].is_string())
            variant = j["variantRef"].get<std::string>();
        r.key = StockKey::Of(j.at("productRef").get<std::string>(), variant);
        r.quantityAvailable = j.at("quantityAvailable").get<int>();
        r.quantityReserved = j.at("quantityReserved").get<int>();
        r.minimumStockLevel = j.at("minimumStockLevel").get<int>();
        r.reorderPoint = j.at("reorderPoint").get<int>();
        r.lastUpdated = std::chrono::system_clock::time_point(std::chrono::milliseconds(j.at("lastUpdated").get<std::int64_t>()));
        r.version = j.at("version").get<std::int64_t>();
        return InventoryLedger::FromRecord(r);
    } catch (const json::exception&) {
        return std::nullopt;
    }
}
