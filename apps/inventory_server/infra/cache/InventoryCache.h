#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "domain/InventoryPorts.h"

class RedisPool;
class RedisClient;

/**
 * @brief InventoryCache：Redis 库存缓存
 *
 * 键格式：<prefix>ledger:<product>[:<variant>]（台账快照 JSON）
 *        <prefix>availability:<product>[:<variant>]（可用数量）
 * 每次提交后由领域服务显式删除两类键；读取未命中时回源并回填。
 * Redis 不可用时读返回未命中、写静默失败，只记录日志。
 */
class InventoryCache : public StockCacheInvalidator, public LedgerSnapshotCache {
public:
    struct Options {
        std::string keyPrefix{"inventory:"};
        std::chrono::seconds ttl{std::chrono::seconds(30)};
    };

    InventoryCache(std::shared_ptr<RedisPool> pool, Options options);

    std::shared_ptr<RedisPool> pool() const noexcept { return pool_; }
    const Options& options() const noexcept { return options_; }

    void Invalidate(const StockKey& key) override;
    std::optional<InventoryLedger> GetLedger(const StockKey& key) override;
    void PutLedger(const InventoryLedger& ledger) override;

    std::string buildLedgerKey(const StockKey& key) const;
    std::string buildAvailabilityKey(const StockKey& key) const;

    static std::string SerializeLedger(const InventoryLedger& ledger);
    static std::optional<InventoryLedger> DeserializeLedger(std::string_view payload);

private:
    std::shared_ptr<RedisPool> pool_;
    Options options_;
};
